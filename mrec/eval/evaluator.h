#ifndef MREC_EVAL_EVALUATOR_H_
#define MREC_EVAL_EVALUATOR_H_

#include <armadillo>

#include "../entry.h"

namespace mrec {

namespace eval {

struct Score {
  double rmse;
  // Rank-correlation shortcut formula applied to raw rating differences
  double spearman;
  size_t n;
};

class Evaluator {
 public:
  /**
   * Compare `predicted` with `truth` at the given entries
   *
   * NaN predictions count as 0. The correlation is
   * 1 - 6 * sum(d^2) / (n * (n^2 - 1)) with d the rating difference, which
   * only equals Spearman's rho if the ratings were ranks. It is NaN for a
   * single entry.
   */
  static Score score(const arma::fmat& predicted, const arma::sp_fmat& truth,
                     const Entries& entries);
};
}
}

#endif  // MREC_EVAL_EVALUATOR_H_
