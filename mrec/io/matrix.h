#ifndef MREC_IO_MATRIX_H_
#define MREC_IO_MATRIX_H_

#include <fstream>
#include <string>

#include <armadillo>

namespace mrec {

namespace io {

/**
 * Sparse rating matrices in the binary coordinate format
 *
 * Layout: int32 rows, int32 cols, int32 nnz, followed by nnz uint32 row
 * indices, nnz uint32 column indices and nnz float32 values.
 */
class Matrix {
 public:
  static arma::sp_fmat load(const std::string& path);

  static arma::sp_fmat fromStream(std::istream& f);
};
}
}

#endif  // MREC_IO_MATRIX_H_
