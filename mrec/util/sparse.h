#ifndef MREC_UTIL_SPARSE_H_
#define MREC_UTIL_SPARSE_H_

#include <armadillo>

#include "../entry.h"

namespace mrec {

namespace util {

namespace sparse {

/**
 * Sum of squares of the stored entries of each row
 */
arma::fvec rowSquaredNorms(const arma::sp_fmat& A);

/**
 * Sum of squares of the stored entries of each column
 */
arma::fvec colSquaredNorms(const arma::sp_fmat& A);

arma::fvec rowNorms(const arma::sp_fmat& A);

/**
 * Mean over the stored entries of each row, 0 for rows without entries
 */
arma::fvec rowMeans(const arma::sp_fmat& A);

/**
 * Mean over the stored entries of each column, 0 for columns without entries
 */
arma::fvec colMeans(const arma::sp_fmat& A);

/**
 * Mean over all stored entries of A, 0 if A has none
 */
float mean(const arma::sp_fmat& A);

/**
 * Subtract the i-th value of b from the non-zero entries in the i-th row of A
 */
arma::sp_fmat subtractRowwise(const arma::sp_fmat& A, const arma::fvec& b);

/**
 * Positions of the stored entries in column-major order
 */
Entries locations(const arma::sp_fmat& A);

/**
 * Copy of M with every NaN replaced by 0
 */
arma::fmat dropNan(const arma::fmat& M);
}
}
}

#endif  // MREC_UTIL_SPARSE_H_
