#include <glog/logging.h>

#include "../util/sparse.h"
#include "normalizer.h"

namespace mrec {

namespace data {

Centered Normalizer::center(const arma::sp_fmat& original) {
  Centered c;

  c.rowMeans = mrec::util::sparse::rowMeans(original);
  c.normalized = mrec::util::sparse::subtractRowwise(original, c.rowMeans);

  LOG(INFO) << "Centered " << original.n_rows << " rows, "
            << original.n_nonzero - c.normalized.n_nonzero
            << " ratings equal to their row mean";

  return c;
}
}
}
