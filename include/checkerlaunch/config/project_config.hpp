#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::config {

inline constexpr auto kConfigFileName = "checker.toml";
inline constexpr auto kDefaultExecutable = "javac";
inline constexpr auto kDefaultInclude = "**/*.java";

// User-facing options of a check run.
struct CheckerOptions {
  std::vector<std::string> processors;
  std::optional<std::string> checker_version;
  std::vector<std::string> extra_args;
  bool skip = false;
  bool proc_only = true;
  bool fail_on_error = true;
  bool exclude_tests = true;
  bool suppress_lombok_warnings = true;
  std::string executable = kDefaultExecutable;
  std::vector<std::string> includes;
  std::vector<std::string> excludes;
};

struct RepositoryConfig {
  // Root of the local artifact cache (maven layout). Empty disables the
  // local-cache tier.
  std::filesystem::path local;
  // argv template for remote retrieval; empty disables the remote tier.
  std::vector<std::string> fetch_command;
};

struct ProjectConfig {
  BuildContext build;
  CheckerOptions options;
  RepositoryConfig repository;

  // Path of the checker.toml this was loaded from
  std::filesystem::path config_path;
};

// Search for checker.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse checker.toml.
// Returns error Diagnostic on parse errors or missing required sections.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// $HOME/.m2/repository, or empty when HOME is unset.
auto DefaultLocalRepository() -> std::filesystem::path;

}  // namespace checkerlaunch::config
