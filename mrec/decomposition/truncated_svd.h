#ifndef MREC_DECOMPOSITION_TRUNCATED_SVD_H_
#define MREC_DECOMPOSITION_TRUNCATED_SVD_H_

#include <armadillo>

namespace mrec {

namespace decomposition {

/**
 * Singular triple with singular values in descending order
 */
struct Decomposition {
  arma::fmat U;
  arma::fvec s;
  arma::fmat Vt;
};

/**
 * Rank-k SVD of a sparse matrix that keeps only as many of the largest
 * singular values as are needed to retain a fraction of the energy
 */
class TruncatedSvd {
 public:
  /**
   * Compute the k largest singular triples of A and keep the smallest prefix
   * of them whose squared singular values sum to at least `energy` times the
   * squared sum over all k
   *
   * Requires 0 < k < min(A.n_rows, A.n_cols) and 0 < energy <= 1.
   */
  static Decomposition decompose(const arma::sp_fmat& A, const int k,
                                 const float energy);

  /**
   * Number of leading values of the descending s to keep for `energy`
   */
  static arma::uword cutoff(const arma::fvec& s, const float energy);

  static arma::fmat reconstruct(const Decomposition& d);

  /**
   * Decompose and reconstruct A in one go
   */
  static arma::fmat svd(const arma::sp_fmat& A, const int k,
                        const float energy);
};
}
}

#endif  // MREC_DECOMPOSITION_TRUNCATED_SVD_H_
