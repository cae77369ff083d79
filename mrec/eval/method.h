#ifndef MREC_EVAL_METHOD_H_
#define MREC_EVAL_METHOD_H_

#include <string>
#include <vector>

namespace mrec {

namespace eval {

enum class Method { CF, CF_BASELINE, SVD, CUR };

/**
 * Map the names cf, cf-baseline, svd and cur to methods, keeping their order
 *
 * Throws std::invalid_argument for the first unknown name, before any method
 * has been run.
 */
std::vector<Method> parseMethods(const std::vector<std::string>& names);
}
}

#endif  // MREC_EVAL_METHOD_H_
