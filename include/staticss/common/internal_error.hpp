#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace staticss::common {

// Exception type for internal staticss errors (bugs, not user input)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in staticss. Please report it with the input "
                "that triggered it.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace staticss::common
