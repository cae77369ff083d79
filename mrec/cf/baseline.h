#ifndef MREC_CF_BASELINE_H_
#define MREC_CF_BASELINE_H_

#include <armadillo>

namespace mrec {

namespace cf {

/**
 * Mean ratings over the rated entries of a rating matrix
 */
struct Baseline {
  float mean;
  arma::fvec userMeans;
  arma::fvec itemMeans;

  static Baseline compute(const arma::sp_fmat& original);
};
}
}

#endif  // MREC_CF_BASELINE_H_
