#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace weft::common {

// Exception type for internal weft errors (weaver bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in weft, please report it together with the "
                "module image that triggered it.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace weft::common
