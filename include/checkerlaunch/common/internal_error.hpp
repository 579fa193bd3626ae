#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace checkerlaunch::common {

// Exception type for internal launcher errors (bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in checkerlaunch.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace checkerlaunch::common
