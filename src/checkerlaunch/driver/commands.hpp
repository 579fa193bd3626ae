#pragma once

#include <argparse/argparse.hpp>

namespace checkerlaunch::driver {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitCheckerFailure = 1;
inline constexpr int kExitError = 2;

// Options shared by every subcommand: project location, checker options
// that override checker.toml, verbosity.
void AddProjectFlags(argparse::ArgumentParser& cmd);

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto PlanCommand(const argparse::ArgumentParser& cmd) -> int;
auto VersionsCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace checkerlaunch::driver
