#ifndef MREC_CF_PREDICTOR_H_
#define MREC_CF_PREDICTOR_H_

#include <armadillo>

#include "../entry.h"
#include "similarity.h"

namespace mrec {

namespace cf {

/**
 * User-user collaborative filtering
 *
 * A rating is predicted as the similarity weighted average of the ratings of
 * the k most similar users. In baseline mode the neighbours' deviations from
 * their mean ratings are averaged instead and added to the user's mean.
 */
class Predictor {
 public:
  Predictor(const int k, const bool baseline, const arma::uword blockRows = 0)
      : k(k), baseline(baseline), blockRows(blockRows) {}

  /**
   * Predict the ratings at `entries`
   *
   * Similarities are computed on `normalized`, ratings are taken from
   * `original`. The result is a dense copy of `original` with only the
   * entries overwritten.
   */
  arma::fmat predict(const arma::sp_fmat& normalized,
                     const arma::sp_fmat& original,
                     const Entries& entries) const;

  Neighbourhood neighbourhood(const arma::sp_fmat& normalized) const;

  /**
   * Predict `offsets[r] + sum(s_j * (R(j, c) - offsets[j])) / sum(s_j)` for
   * each entry (r, c), summing over the neighbours j of r
   *
   * An entry whose neighbours all have similarity 0 is predicted as 0.
   */
  static arma::fmat predictWith(const Neighbourhood& nb,
                                const arma::sp_fmat& original,
                                const Entries& entries,
                                const arma::fvec& offsets);

 private:
  const int k;
  const bool baseline;
  const arma::uword blockRows;
};
}
}

#endif  // MREC_CF_PREDICTOR_H_
