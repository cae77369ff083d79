#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include "matrix.h"

namespace mrec {

namespace io {

arma::sp_fmat Matrix::load(const std::string& path) {
  std::ifstream f(path, std::ios::binary);

  if (!f.is_open()) {
    throw std::invalid_argument("Could not open file " + path);
  }

  arma::sp_fmat R = Matrix::fromStream(f);
  LOG(INFO) << "Loaded " << R.n_rows << "x" << R.n_cols << " matrix with "
            << R.n_nonzero << " ratings from " << path;

  return R;
}

arma::sp_fmat Matrix::fromStream(std::istream& f) {
  int m;
  int n;
  int nnz;
  std::vector<unsigned int> rowdata;
  std::vector<unsigned int> coldata;
  std::vector<float> vals;

  // Header: shape and number of stored entries
  f.read(reinterpret_cast<char*>(&m), sizeof(m));
  f.read(reinterpret_cast<char*>(&n), sizeof(n));
  f.read(reinterpret_cast<char*>(&nnz), sizeof(nnz));

  if (!f || m < 0 || n < 0 || nnz < 0) {
    throw std::runtime_error("Invalid sparse matrix header");
  }

  rowdata.resize(nnz);
  coldata.resize(nnz);
  vals.resize(nnz);

  // Three parallel arrays of nnz entries each
  f.read(reinterpret_cast<char*>(rowdata.data()), nnz * sizeof(rowdata[0]));
  f.read(reinterpret_cast<char*>(coldata.data()), nnz * sizeof(coldata[0]));
  f.read(reinterpret_cast<char*>(vals.data()), nnz * sizeof(vals[0]));

  if (!f) {
    throw std::runtime_error("Sparse matrix data is truncated");
  }

  for (int i = 0; i < nnz; i++) {
    if (rowdata[i] >= static_cast<unsigned int>(m) ||
        coldata[i] >= static_cast<unsigned int>(n)) {
      throw std::runtime_error("Sparse matrix entry out of bounds");
    }
  }

  arma::urowvec rows(std::vector<arma::uword>(rowdata.begin(), rowdata.end()));
  arma::urowvec cols(std::vector<arma::uword>(coldata.begin(), coldata.end()));
  arma::umat locations = arma::join_cols(rows, cols);

  return arma::sp_fmat(locations, arma::fvec(vals), m, n);
}
}
}
