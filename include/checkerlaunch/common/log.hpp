#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace checkerlaunch::common {

// Logger used by the launcher binary: colored stderr sink,
// "[checkerlaunch] [level] message" lines, info level unless verbose.
auto MakeConsoleLogger(bool verbose) -> std::shared_ptr<spdlog::logger>;

// Logger writing to caller-provided sinks (tests capture output this way).
auto MakeLogger(
    const std::string& name, std::vector<spdlog::sink_ptr> sinks,
    bool verbose = true) -> std::shared_ptr<spdlog::logger>;

}  // namespace checkerlaunch::common
