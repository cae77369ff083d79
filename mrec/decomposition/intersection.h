#ifndef MREC_DECOMPOSITION_INTERSECTION_H_
#define MREC_DECOMPOSITION_INTERSECTION_H_

#include <armadillo>

namespace mrec {

namespace decomposition {

/**
 * Sparse W with W(i, j) = A(rows[i], cols[j])
 *
 * Zero intersections are not stored.
 */
arma::sp_fmat intersect(const arma::sp_fmat& A, const arma::uvec& rows,
                        const arma::uvec& cols);
}
}

#endif  // MREC_DECOMPOSITION_INTERSECTION_H_
