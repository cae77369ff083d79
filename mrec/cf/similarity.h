#ifndef MREC_CF_SIMILARITY_H_
#define MREC_CF_SIMILARITY_H_

#include <armadillo>

namespace mrec {

namespace cf {

/**
 * The k most similar rows of every row, most similar first
 */
struct Neighbourhood {
  // n x k indices of the neighbours
  arma::umat indices;
  // n x k similarities of each row to its neighbours
  arma::fmat similarities;
};

class Similarity {
 public:
  // Below any cosine similarity so that a row never neighbours itself
  static const float SELF;

  /**
   * Symmetric cosine similarity between all rows of A
   *
   * Similarities involving rows of zero norm are 0 and the diagonal is SELF.
   * Takes O(n^2) memory for n rows.
   */
  static arma::fmat cosine(const arma::sp_fmat& A);

  /**
   * Rows first..last of the cosine similarity matrix of A, given its
   * transpose At and the row norms of A
   */
  static arma::fmat block(const arma::sp_fmat& A, const arma::sp_fmat& At,
                          const arma::fvec& norms, const arma::uword first,
                          const arma::uword last);

  /**
   * Select the k most similar columns for each row of `sim`
   *
   * Ties are broken in favour of the lower index.
   */
  static Neighbourhood nearest(const arma::fmat& sim, const int k);

  /**
   * Neighbourhoods of all rows of A, computing the similarities in blocks
   * of `blockRows` rows. Memory stays at O(blockRows * n).
   */
  static Neighbourhood nearestBlocked(const arma::sp_fmat& A, const int k,
                                      const arma::uword blockRows);
};
}
}

#endif  // MREC_CF_SIMILARITY_H_
