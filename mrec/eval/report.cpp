#include "report.h"

namespace mrec {

namespace eval {

void Report::print(const Score& score) {
  this->out << "RMSE Error : " << score.rmse
            << "\t Spearman Correlation : " << score.spearman * 100 << "%"
            << std::endl;
}
}
}
