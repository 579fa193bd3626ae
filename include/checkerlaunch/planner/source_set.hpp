#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/config/build_context.hpp"
#include "checkerlaunch/lombok/lombok.hpp"

namespace checkerlaunch::planner {

// Enabled source roots to analyze. Delombok output, when present, replaces
// the main roots (and the test roots for the test output directory).
auto SelectSourceRoots(
    const config::BuildContext& build, const lombok::LombokState& lombok,
    bool exclude_tests) -> std::vector<std::filesystem::path>;

// Match a '/'-separated relative path against an ant-style pattern:
// "**" spans any number of directories, '*' and '?' stay within one.
auto MatchesPattern(std::string_view pattern, std::string_view relative_path)
    -> bool;

// Version-control metadata, excluded in addition to the configured excludes.
inline constexpr std::array<std::string_view, 9> kDefaultExcludes = {
    "**/.git/**", "**/.svn/**", "**/.hg/**",     "**/.bzr/**",
    "**/CVS/**",  "**/RCS/**",  "**/SCCS/**",    "**/_darcs/**",
    "**/.arch-ids/**",
};

// Walk each root recursively and collect absolute paths of regular files
// that match an include pattern and no exclude pattern. Missing roots are
// skipped. Results are sorted per root. A walk cut short by a filesystem
// error keeps what it found and is reported as a warning.
auto ScanSources(
    const std::vector<std::filesystem::path>& roots,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes, spdlog::logger& log)
    -> std::vector<std::filesystem::path>;

}  // namespace checkerlaunch::planner
