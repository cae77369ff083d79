#ifndef MREC_DECOMPOSITION_CUR_H_
#define MREC_DECOMPOSITION_CUR_H_

#include <random>

#include <armadillo>

#include "truncated_svd.h"

namespace mrec {

namespace decomposition {

/**
 * Columns (or rows, when sampling the transpose) drawn for C and R
 */
struct Sample {
  // Selected indices in ascending order
  arma::uvec indices;
  // Selection probability of each selected index
  arma::fvec probabilities;
  // The selected columns, each scaled by 1 / sqrt(size * probability)
  arma::sp_fmat scaled;
};

/**
 * CUR decomposition with norm-based column and row probabilities
 */
class Cur {
 public:
  Cur(const int samples, const int k, const float energy, std::mt19937 rng)
      : samples(samples), k(k), energy(energy), rng(rng) {}

  /**
   * Approximate A by C * U * R
   *
   * Requires 1 <= k < samples. NaN entries caused by vanishing singular
   * values of the intersection are set to 0, infinite ones are kept.
   */
  arma::fmat approximate(const arma::sp_fmat& A);

  /**
   * Draw `samples` distinct columns of A with non-zero norm uniformly at
   * random and scale them by their squared-norm probabilities
   */
  Sample sampleColumns(const arma::sp_fmat& A);

  /**
   * Pseudo-inverse core U = Y * diag(1 / z)^2 * X^T of W = X * diag(z) * Y^T
   */
  arma::fmat core(const arma::sp_fmat& W) const;

  static arma::fmat pseudoInverse(const Decomposition& d);

 private:
  const int samples;
  const int k;
  const float energy;
  std::mt19937 rng;
};
}
}

#endif  // MREC_DECOMPOSITION_CUR_H_
