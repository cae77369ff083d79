#include <cmath>
#include <limits>
#include <stdexcept>

#include "evaluator.h"

namespace mrec {

namespace eval {

Score Evaluator::score(const arma::fmat& predicted, const arma::sp_fmat& truth,
                       const Entries& entries) {
  if (entries.empty()) {
    throw std::invalid_argument("Cannot score an empty test set");
  }

  double total = 0.0;
  for (const Entry& e : entries) {
    if (e.row >= predicted.n_rows || e.col >= predicted.n_cols ||
        e.row >= truth.n_rows || e.col >= truth.n_cols) {
      throw std::out_of_range("Test entry outside of the rating matrix");
    }

    float p = predicted(e.row, e.col);
    if (std::isnan(p)) {
      p = 0.0;
    }

    const double d = static_cast<double>(truth(e.row, e.col)) - p;
    total += d * d;
  }

  Score s;
  s.n = entries.size();
  s.rmse = std::sqrt(total / s.n);

  const double n = s.n;
  if (s.n > 1) {
    s.spearman = 1.0 - (6.0 * total) / (n * (n * n - 1.0));
  } else {
    s.spearman = std::numeric_limits<double>::quiet_NaN();
  }

  return s;
}
}
}
