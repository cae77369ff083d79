#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "../util/sparse.h"
#include "similarity.h"

namespace mrec {

namespace cf {

const float Similarity::SELF = -2.0;

namespace {

void checkNeighbours(const int k, const arma::uword n) {
  if (k <= 0 || static_cast<arma::uword>(k) >= n) {
    std::ostringstream msg;
    msg << "Neighbourhood size " << k << " must lie in [1, " << n << ")";
    throw std::invalid_argument(msg.str());
  }
}
}

arma::fmat Similarity::cosine(const arma::sp_fmat& A) {
  const arma::fvec norms = mrec::util::sparse::rowNorms(A);

  if (A.n_rows == 0) {
    return arma::fmat();
  }

  // Mirror the upper triangle so that the result is exactly symmetric
  const arma::sp_fmat At = A.t();
  arma::fmat sim =
      arma::symmatu(Similarity::block(A, At, norms, 0, A.n_rows - 1));
  sim.diag().fill(Similarity::SELF);

  return sim;
}

arma::fmat Similarity::block(const arma::sp_fmat& A, const arma::sp_fmat& At,
                             const arma::fvec& norms, const arma::uword first,
                             const arma::uword last) {
  const arma::sp_fmat rows = A.rows(first, last);
  arma::fmat sim(rows * At);

  for (arma::uword j = 0; j < sim.n_cols; j++) {
    for (arma::uword i = 0; i < sim.n_rows; i++) {
      const float s = sim(i, j) / (norms(first + i) * norms(j));

      // 0 / 0 for rows with zero norm
      sim(i, j) = std::isnan(s) ? 0.0f : s;
    }
  }

  for (arma::uword i = 0; i < sim.n_rows; i++) {
    sim(i, first + i) = Similarity::SELF;
  }

  return sim;
}

Neighbourhood Similarity::nearest(const arma::fmat& sim, const int k) {
  checkNeighbours(k, sim.n_cols);

  Neighbourhood nb;
  nb.indices.set_size(sim.n_rows, k);
  nb.similarities.set_size(sim.n_rows, k);

  for (arma::uword i = 0; i < sim.n_rows; i++) {
    const arma::frowvec row = sim.row(i);
    const arma::uvec order = arma::stable_sort_index(row, "descend");

    for (int x = 0; x < k; x++) {
      nb.indices(i, x) = order(x);
      nb.similarities(i, x) = row(order(x));
    }
  }

  return nb;
}

Neighbourhood Similarity::nearestBlocked(const arma::sp_fmat& A, const int k,
                                         const arma::uword blockRows) {
  checkNeighbours(k, A.n_rows);

  if (blockRows == 0) {
    return Similarity::nearest(Similarity::cosine(A), k);
  }

  const arma::fvec norms = mrec::util::sparse::rowNorms(A);
  const arma::sp_fmat At = A.t();

  Neighbourhood nb;
  nb.indices.set_size(A.n_rows, k);
  nb.similarities.set_size(A.n_rows, k);

  for (arma::uword first = 0; first < A.n_rows; first += blockRows) {
    const arma::uword last = std::min(first + blockRows, A.n_rows) - 1;
    const Neighbourhood part =
        Similarity::nearest(Similarity::block(A, At, norms, first, last), k);

    nb.indices.rows(first, last) = part.indices;
    nb.similarities.rows(first, last) = part.similarities;
  }

  return nb;
}
}
}
