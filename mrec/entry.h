#ifndef MREC_ENTRY_H_
#define MREC_ENTRY_H_

#include <vector>

#include <armadillo>

namespace mrec {

/**
 * A 0-based (user, item) position in a rating matrix
 */
struct Entry {
  arma::uword row;
  arma::uword col;

  Entry(arma::uword row, arma::uword col) : row(row), col(col) {}

  bool operator==(const Entry& other) const {
    return this->row == other.row && this->col == other.col;
  }
};

typedef std::vector<Entry> Entries;
}

#endif  // MREC_ENTRY_H_
