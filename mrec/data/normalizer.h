#ifndef MREC_DATA_NORMALIZER_H_
#define MREC_DATA_NORMALIZER_H_

#include <armadillo>

namespace mrec {

namespace data {

/**
 * Rating matrix with each user's mean rating removed
 */
struct Centered {
  arma::sp_fmat normalized;
  arma::fvec rowMeans;
};

class Normalizer {
 public:
  /**
   * Subtract each row's mean over its stored ratings from those ratings
   *
   * Ratings equal to their row mean become zero and drop out of the sparse
   * structure.
   */
  static Centered center(const arma::sp_fmat& original);
};
}
}

#endif  // MREC_DATA_NORMALIZER_H_
