#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"

namespace checkerlaunch::common {

struct SubprocessResult {
  int exit_code;
  std::string output;  // merged stdout and stderr
};

// Called once per output line, without the trailing newline.
using LineCallback = std::function<void(std::string_view)>;

// Execute command with argv array (no shell interpretation).
// argv[0] = program name, argv[1..n] = arguments. stdin is not connected.
// stdout and stderr are merged and fully drained before waiting for the
// child, so a chatty child cannot block on a full pipe.
// Returns a host error if the process cannot be started.
auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir = std::nullopt,
    const LineCallback& on_line = {}) -> Result<SubprocessResult>;

}  // namespace checkerlaunch::common
