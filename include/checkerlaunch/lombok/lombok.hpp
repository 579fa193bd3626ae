#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::lombok {

inline constexpr auto kLombokGroup = "org.projectlombok";
inline constexpr auto kLombokName = "lombok";
inline constexpr auto kLombokPluginName = "lombok-maven-plugin";

inline constexpr auto kDelombokGoal = "delombok";
inline constexpr auto kTestDelombokGoal = "testDelombok";
inline constexpr auto kOutputDirectoryKey = "outputDirectory";

inline constexpr auto kBuildDirectoryPlaceholder = "${project.build.directory}";
inline constexpr auto kBaseDirPlaceholder = "${project.basedir}";

// Conventional test output of the delombok plugin.
inline constexpr auto kDefaultTestDelombokDir =
    "${project.build.directory}/generated-test-sources/delombok";

inline constexpr std::string_view kSuppressWarningsPrefix =
    "-AsuppressWarnings";
inline constexpr std::string_view kTypeAnnoBeforeModifier =
    "type.anno.before.modifier";

// Sampled once per run; consumers reuse it instead of re-detecting.
struct LombokState {
  bool is_used = false;
  // Set only when the directory exists on disk.
  std::optional<std::filesystem::path> delombok_dir;
  std::optional<std::filesystem::path> test_delombok_dir;
};

// Lombok is declared as a dependency or its build plugin is configured.
auto IsLombokUsed(const config::BuildContext& build) -> bool;

// Substitute the build-directory and basedir placeholders; a relative
// result is taken relative to the project base directory.
auto ResolveBuildPath(std::string expression, const config::BuildContext& build)
    -> std::filesystem::path;

// The configured delombok output directory: the delombok execution's
// outputDirectory, else the plugin-level one. Existence is not checked.
auto FindDelombokOutputDirectory(const config::BuildContext& build)
    -> std::optional<std::filesystem::path>;

// The testDelombok execution's outputDirectory, else the plugin's
// conventional test output directory.
auto FindTestDelombokOutputDirectory(const config::BuildContext& build)
    -> std::optional<std::filesystem::path>;

// Processors whose builder checks need Lombok's @Generated annotations.
auto HasBuilderSensitiveChecker(const std::vector<std::string>& processors)
    -> bool;

// Detect Lombok and its output directories, logging what was found.
auto Detect(
    const config::BuildContext& build,
    const std::vector<std::string>& processors, spdlog::logger& log)
    -> LombokState;

// Merge the type.anno.before.modifier key into the -AsuppressWarnings
// argument of `args`: unchanged if already present, appended with a comma
// to an existing argument, or added as a new argument.
auto MergeSuppressWarnings(std::vector<std::string> args)
    -> std::vector<std::string>;

}  // namespace checkerlaunch::lombok
