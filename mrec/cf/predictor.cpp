#include <limits>
#include <stdexcept>

#include <glog/logging.h>

#include "../util/sparse.h"
#include "../util/timer.h"
#include "baseline.h"
#include "predictor.h"

namespace mrec {

namespace cf {

arma::fmat Predictor::predict(const arma::sp_fmat& normalized,
                              const arma::sp_fmat& original,
                              const Entries& entries) const {
  if (normalized.n_rows != original.n_rows) {
    throw std::invalid_argument(
        "Normalized and original matrix differ in their number of users");
  }

  if (this->baseline) {
    LOG(INFO) << "---------- Collaborative Filtering with Baseline Approach "
                 "----------";
  } else {
    LOG(INFO) << "---------- Collaborative Filtering ----------";
  }
  mrec::util::Timer timer;

  const Neighbourhood nb = this->neighbourhood(normalized);
  LOG(INFO) << "Calculated similarities and found neighbourhoods in "
            << timer.seconds() << " secs.";

  arma::fvec offsets(original.n_rows, arma::fill::zeros);
  if (this->baseline) {
    const Baseline b = Baseline::compute(original);
    LOG(INFO) << "Global mean rating " << b.mean;

    offsets = b.userMeans;
  }

  const arma::fmat prediction =
      Predictor::predictWith(nb, original, entries, offsets);
  LOG(INFO) << "Collaborative filtering"
            << (this->baseline ? " with baseline approach" : "") << " took "
            << timer.seconds() << " secs.";

  return prediction;
}

Neighbourhood Predictor::neighbourhood(
    const arma::sp_fmat& normalized) const {
  return Similarity::nearestBlocked(normalized, this->k, this->blockRows);
}

arma::fmat Predictor::predictWith(const Neighbourhood& nb,
                                  const arma::sp_fmat& original,
                                  const Entries& entries,
                                  const arma::fvec& offsets) {
  if (nb.indices.n_rows != original.n_rows ||
      offsets.n_elem != original.n_rows) {
    throw std::invalid_argument("Neighbourhood does not match the ratings");
  }

  // Neighbour ratings are always read from `original`, never from `R`
  arma::fmat R(original);

  const size_t n = entries.size();
  for (size_t i = 0; i < n; i++) {
    const arma::uword r = entries[i].row;
    const arma::uword c = entries[i].col;

    if (r >= original.n_rows || c >= original.n_cols) {
      throw std::out_of_range("Test entry outside of the rating matrix");
    }

    float weighted = 0.0;
    float total = 0.0;
    for (arma::uword x = 0; x < nb.indices.n_cols; x++) {
      const arma::uword j = nb.indices(r, x);
      const float s = nb.similarities(r, x);

      weighted += s * (original(j, c) - offsets(j));
      total += s;
    }

    if (total == 0.0) {
      R(r, c) = std::numeric_limits<float>::quiet_NaN();
    } else {
      R(r, c) = offsets(r) + weighted / total;
    }

    if ((i + 1) % 40000 == 0) {
      LOG(INFO) << "Predicted " << i + 1 << " ratings.";
    } else if (i + 1 == n) {
      LOG(INFO) << "Predicted all " << n << " ratings.";
    }
  }

  return mrec::util::sparse::dropNan(R);
}
}
}
