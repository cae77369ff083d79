#include <cmath>
#include <stdexcept>

#include "sparse.h"

namespace mrec {

namespace util {

namespace sparse {

arma::fvec rowSquaredNorms(const arma::sp_fmat& A) {
  arma::fvec norms(A.n_rows, arma::fill::zeros);

  for (arma::sp_fmat::const_iterator it = A.begin(), end = A.end(); it != end;
       ++it) {
    const float v = *it;
    norms(it.row()) += v * v;
  }

  return norms;
}

arma::fvec colSquaredNorms(const arma::sp_fmat& A) {
  arma::fvec norms(A.n_cols, arma::fill::zeros);

  for (arma::sp_fmat::const_iterator it = A.begin(), end = A.end(); it != end;
       ++it) {
    const float v = *it;
    norms(it.col()) += v * v;
  }

  return norms;
}

arma::fvec rowNorms(const arma::sp_fmat& A) {
  return arma::sqrt(rowSquaredNorms(A));
}

arma::fvec rowMeans(const arma::sp_fmat& A) {
  arma::fvec sums(A.n_rows, arma::fill::zeros);
  arma::fvec counts(A.n_rows, arma::fill::zeros);

  for (arma::sp_fmat::const_iterator it = A.begin(), end = A.end(); it != end;
       ++it) {
    sums(it.row()) += *it;
    counts(it.row()) += 1;
  }

  arma::fvec means(A.n_rows, arma::fill::zeros);
  for (arma::uword i = 0; i < A.n_rows; i++) {
    if (counts(i) > 0) {
      means(i) = sums(i) / counts(i);
    }
  }

  return means;
}

arma::fvec colMeans(const arma::sp_fmat& A) {
  arma::fvec means(A.n_cols, arma::fill::zeros);

  // Columns are contiguous in the CCS storage format
  for (arma::uword i = 0; i < A.n_cols; i++) {
    const arma::sp_fmat col = A.col(i);

    if (col.n_nonzero > 0) {
      means(i) = arma::accu(col) / col.n_nonzero;
    }
  }

  return means;
}

float mean(const arma::sp_fmat& A) {
  if (A.n_nonzero == 0) {
    return 0.0;
  }

  return arma::accu(A) / A.n_nonzero;
}

arma::sp_fmat subtractRowwise(const arma::sp_fmat& A, const arma::fvec& b) {
  if (b.n_elem != A.n_rows) {
    throw std::invalid_argument("Need one value per row to subtract");
  }

  arma::umat locs(2, A.n_nonzero);
  arma::fvec vals(A.n_nonzero);

  arma::uword i = 0;
  for (arma::sp_fmat::const_iterator it = A.begin(), end = A.end(); it != end;
       ++it, ++i) {
    locs(0, i) = it.row();
    locs(1, i) = it.col();
    vals(i) = (*it) - b(it.row());
  }

  // The batch constructor drops entries that became zero
  return arma::sp_fmat(locs, vals, A.n_rows, A.n_cols);
}

Entries locations(const arma::sp_fmat& A) {
  Entries entries;
  entries.reserve(A.n_nonzero);

  for (arma::sp_fmat::const_iterator it = A.begin(), end = A.end(); it != end;
       ++it) {
    entries.push_back(Entry(it.row(), it.col()));
  }

  return entries;
}

arma::fmat dropNan(const arma::fmat& M) {
  arma::fmat clean(M);
  clean.transform([](float v) { return std::isnan(v) ? 0.0f : v; });

  return clean;
}
}
}
}
