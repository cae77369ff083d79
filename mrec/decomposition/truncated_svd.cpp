#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

#include "../util/sparse.h"
#include "../util/timer.h"
#include "truncated_svd.h"

namespace mrec {

namespace decomposition {

Decomposition TruncatedSvd::decompose(const arma::sp_fmat& A, const int k,
                                      const float energy) {
  const arma::uword maxRank = std::min(A.n_rows, A.n_cols);

  if (k <= 0 || static_cast<arma::uword>(k) >= maxRank) {
    std::ostringstream msg;
    msg << "Rank " << k << " must lie in [1, " << maxRank << ") for a "
        << A.n_rows << "x" << A.n_cols << " matrix";
    throw std::invalid_argument(msg.str());
  }

  if (!(energy > 0.0 && energy <= 1.0)) {
    throw std::invalid_argument("Energy has to be in (0, 1]");
  }

  arma::fmat U;
  arma::fvec s;
  arma::fmat V;

  if (!arma::svds(U, s, V, A, k) || s.n_elem == 0) {
    throw std::runtime_error("Sparse SVD did not converge");
  }

  // svds may find fewer than k values but always sorts them descending
  const arma::uword m = TruncatedSvd::cutoff(s, energy);

  Decomposition d;
  d.U = U.head_cols(m);
  d.s = s.head(m);
  d.Vt = V.head_cols(m).t();

  return d;
}

arma::uword TruncatedSvd::cutoff(const arma::fvec& s, const float energy) {
  if (energy >= 1.0) {
    return s.n_elem;
  }

  const arma::vec squares = arma::square(arma::conv_to<arma::vec>::from(s));
  const double threshold = energy * arma::accu(squares);

  double retained = 0.0;
  for (arma::uword m = 0; m < squares.n_elem; m++) {
    retained += squares(m);

    if (retained >= threshold) {
      return m + 1;
    }
  }

  return s.n_elem;
}

arma::fmat TruncatedSvd::reconstruct(const Decomposition& d) {
  return d.U * arma::diagmat(d.s) * d.Vt;
}

arma::fmat TruncatedSvd::svd(const arma::sp_fmat& A, const int k,
                             const float energy) {
  LOG(INFO) << "---------- SVD with " << energy * 100 << "% energy ----------";
  mrec::util::Timer timer;

  const Decomposition d = TruncatedSvd::decompose(A, k, energy);
  LOG(INFO) << "Kept " << d.s.n_elem << " of " << k << " singular values";

  const arma::fmat approx =
      mrec::util::sparse::dropNan(TruncatedSvd::reconstruct(d));
  LOG(INFO) << "SVD decomposition with " << energy * 100 << "% energy took "
            << timer.seconds() << " secs.";

  return approx;
}
}
}
