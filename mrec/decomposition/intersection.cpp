#include <stdexcept>
#include <vector>

#include "intersection.h"

namespace mrec {

namespace decomposition {

arma::sp_fmat intersect(const arma::sp_fmat& A, const arma::uvec& rows,
                        const arma::uvec& cols) {
  if ((rows.n_elem > 0 && rows.max() >= A.n_rows) ||
      (cols.n_elem > 0 && cols.max() >= A.n_cols)) {
    throw std::out_of_range("Intersection index outside of the matrix");
  }

  std::vector<arma::uword> locs;
  std::vector<float> vals;

  // Walk W column by column so that the locations come out sorted
  for (arma::uword j = 0; j < cols.n_elem; j++) {
    const arma::sp_fmat col = A.col(cols(j));

    for (arma::uword i = 0; i < rows.n_elem; i++) {
      const float v = col(rows(i), 0);

      if (v != 0.0) {
        locs.push_back(i);
        locs.push_back(j);
        vals.push_back(v);
      }
    }
  }

  const arma::umat locations(locs.data(), 2, vals.size());

  return arma::sp_fmat(locations, arma::fvec(vals), rows.n_elem, cols.n_elem);
}
}
}
