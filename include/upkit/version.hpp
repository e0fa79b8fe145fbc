#ifndef UPKIT_VERSION_HPP
#define UPKIT_VERSION_HPP

#include <string>

namespace upkit {

const std::string UPKIT_VERSION_STRING = "1.0.0";
const int UPKIT_VERSION_MAJOR = 1;
const int UPKIT_VERSION_MINOR = 0;
const int UPKIT_VERSION_PATCH = 0;

} // namespace upkit

#endif // UPKIT_VERSION_HPP
