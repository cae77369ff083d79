#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include "../util/sparse.h"
#include "../util/timer.h"
#include "cur.h"
#include "intersection.h"
#include "truncated_svd.h"

namespace mrec {

namespace decomposition {

arma::fmat Cur::approximate(const arma::sp_fmat& A) {
  LOG(INFO) << "---------- CUR with " << this->energy * 100
            << "% energy ----------";
  mrec::util::Timer timer;

  if (this->k <= 0 || this->k >= this->samples) {
    std::ostringstream msg;
    msg << "Rank " << this->k << " must lie in [1, " << this->samples
        << ") for " << this->samples << " samples";
    throw std::invalid_argument(msg.str());
  }

  // Rows of A are the columns of its transpose
  const arma::sp_fmat At = A.t();
  const Sample cols = this->sampleColumns(A);
  const Sample rows = this->sampleColumns(At);

  const arma::sp_fmat C = cols.scaled;
  const arma::sp_fmat R = rows.scaled.t();
  const arma::sp_fmat W = intersect(A, rows.indices, cols.indices);
  LOG(INFO) << "Building C, R, W matrix took " << timer.seconds() << " secs.";

  const arma::fmat U = this->core(W);

  // Only the final product is dense
  const arma::fmat CU(C * U);
  const arma::fmat approx = mrec::util::sparse::dropNan(arma::fmat(CU * R));
  LOG(INFO) << "CUR decomposition took " << timer.seconds() << " secs.";

  return approx;
}

Sample Cur::sampleColumns(const arma::sp_fmat& A) {
  if (this->samples <= 0) {
    throw std::invalid_argument("Need to sample at least one column");
  }

  const arma::fvec colNorms = mrec::util::sparse::colSquaredNorms(A);
  const float total = arma::accu(colNorms);

  // Columns with zero norm can never be selected meaningfully
  std::vector<arma::uword> candidates;
  for (arma::uword j = 0; j < A.n_cols; j++) {
    if (colNorms(j) > 0.0) {
      candidates.push_back(j);
    }
  }

  if (candidates.size() < static_cast<size_t>(this->samples)) {
    std::ostringstream msg;
    msg << "Cannot sample " << this->samples << " of " << candidates.size()
        << " non-zero columns";
    throw std::invalid_argument(msg.str());
  }

  // Partial Fisher-Yates shuffle for a simple random sample
  for (int i = 0; i < this->samples; i++) {
    std::uniform_int_distribution<size_t> pick(i, candidates.size() - 1);
    std::swap(candidates[i], candidates[pick(this->rng)]);
  }
  std::sort(candidates.begin(), candidates.begin() + this->samples);

  Sample sample;
  sample.indices = arma::uvec(std::vector<arma::uword>(
      candidates.begin(), candidates.begin() + this->samples));
  sample.probabilities = colNorms.elem(sample.indices) / total;

  const arma::fvec scales =
      1.0 / arma::sqrt(this->samples * sample.probabilities);

  std::vector<arma::uword> locs;
  std::vector<float> vals;
  for (int i = 0; i < this->samples; i++) {
    const arma::sp_fmat col = A.col(sample.indices(i));

    for (arma::sp_fmat::const_iterator it = col.begin(), end = col.end();
         it != end; ++it) {
      locs.push_back(it.row());
      locs.push_back(i);
      vals.push_back((*it) * scales(i));
    }
  }

  const arma::umat locations(locs.data(), 2, vals.size());
  sample.scaled =
      arma::sp_fmat(locations, arma::fvec(vals), A.n_rows, this->samples);

  return sample;
}

arma::fmat Cur::core(const arma::sp_fmat& W) const {
  return Cur::pseudoInverse(TruncatedSvd::decompose(W, this->k, this->energy));
}

arma::fmat Cur::pseudoInverse(const Decomposition& d) {
  // Y * diag(1 / z)^2 * X^T with Y = Vt^T and X = U. A zero z turns into
  // inf here and into NaN wherever it meets a zero of X or Y.
  const arma::fvec zinv = 1.0 / d.s;

  return d.Vt.t() * arma::diagmat(arma::square(zinv)) * d.U.t();
}
}
}
