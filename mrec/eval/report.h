#ifndef MREC_EVAL_REPORT_H_
#define MREC_EVAL_REPORT_H_

#include <iostream>

#include "evaluator.h"

namespace mrec {

namespace eval {

class Report {
 public:
  explicit Report(std::ostream& out = std::cout) : out(out) {}

  void print(const Score& score);

 private:
  std::ostream& out;
};
}
}

#endif  // MREC_EVAL_REPORT_H_
