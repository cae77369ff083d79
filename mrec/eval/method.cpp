#include <stdexcept>

#include "method.h"

namespace mrec {

namespace eval {

std::vector<Method> parseMethods(const std::vector<std::string>& names) {
  std::vector<Method> methods;

  for (const std::string& name : names) {
    if (name == "cf") {
      methods.push_back(Method::CF);
    } else if (name == "cf-baseline") {
      methods.push_back(Method::CF_BASELINE);
    } else if (name == "svd") {
      methods.push_back(Method::SVD);
    } else if (name == "cur") {
      methods.push_back(Method::CUR);
    } else {
      throw std::invalid_argument("Unknown method " + name);
    }
  }

  return methods;
}
}
}
