#include "../util/sparse.h"
#include "baseline.h"

namespace mrec {

namespace cf {

Baseline Baseline::compute(const arma::sp_fmat& original) {
  Baseline b;
  b.mean = mrec::util::sparse::mean(original);
  b.userMeans = mrec::util::sparse::rowMeans(original);
  b.itemMeans = mrec::util::sparse::colMeans(original);

  return b;
}
}
}
