#include "checkerlaunch/common/log.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace checkerlaunch::common {

namespace {

constexpr auto kPattern = "[checkerlaunch] [%l] %v";

}  // namespace

auto MakeLogger(
    const std::string& name, std::vector<spdlog::sink_ptr> sinks, bool verbose)
    -> std::shared_ptr<spdlog::logger> {
  auto logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  // Checker output interleaves with our own lines; keep ordering visible.
  logger->flush_on(spdlog::level::debug);
  return logger;
}

auto MakeConsoleLogger(bool verbose) -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return MakeLogger("checkerlaunch", {std::move(sink)}, verbose);
}

}  // namespace checkerlaunch::common
