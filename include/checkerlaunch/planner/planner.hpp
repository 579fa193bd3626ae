#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/artifact/resolver.hpp"
#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/compat/compatibility.hpp"
#include "checkerlaunch/config/build_context.hpp"
#include "checkerlaunch/config/project_config.hpp"
#include "checkerlaunch/lombok/lombok.hpp"
#include "checkerlaunch/planner/invocation_plan.hpp"
#include "checkerlaunch/version/version.hpp"

namespace checkerlaunch::planner {

inline constexpr auto kProcOnlyFlag = "-proc:only";
inline constexpr auto kJavacMainClass = "com.sun.tools.javac.Main";
inline constexpr auto kBootClasspathPrepend = "-Xbootclasspath/p:";
inline constexpr auto kAggregatorPackaging = "pom";

inline constexpr std::string_view kErrorMarker = "error:";
inline constexpr std::string_view kWarningMarker = "warning:";

// Values resolved once at the start of a run and threaded through it.
struct RunContext {
  version::VersionPair versions;
  std::string checker_version;
  compat::CompatibilityDecision decision;
  lombok::LombokState lombok;
  std::string executable;
  bool launcher_mode;
  std::vector<std::filesystem::path> sources;
};

struct SkippedRun {
  std::string reason;
};

using PlanOutcome = std::variant<SkippedRun, InvocationPlan>;

enum class RunOutcome : uint8_t {
  kSkipped,
  kPassed,
  kFailedReported,  // checker failed, fail_on_error disabled
};

struct ExecutionResult {
  int exit_code;
  size_t error_lines;
  size_t warning_lines;
};

// An existing path is used as is; otherwise the toolchain's copy of the
// tool; otherwise the bare name for a PATH lookup.
auto ResolveExecutable(
    const std::string& executable, const config::BuildContext& build)
    -> std::string;

// The executable is a JVM launcher rather than the javac front end.
auto IsLauncher(std::string_view executable) -> bool;

// Explicit option, else the declared checker-qual version, else the default.
auto SelectCheckerVersion(
    const config::BuildContext& build, const config::CheckerOptions& options)
    -> std::string;

// --add-exports/--add-opens flags; prefixed with -J unless the executable
// is itself the JVM launcher.
auto ModuleVisibilityFlags(bool launcher_mode) -> std::vector<std::string>;

// Why the run should not happen at all, if it should not.
auto SkipReason(
    const config::BuildContext& build, const config::CheckerOptions& options)
    -> std::optional<std::string>;

class InvocationPlanner {
 public:
  InvocationPlanner(
      const config::BuildContext& build, const config::CheckerOptions& options,
      artifact::ArtifactResolver& resolver, const version::HostRuntime& host,
      std::shared_ptr<spdlog::logger> log);

  // Resolve everything and assemble the command line. Reference files are
  // created here and owned by the returned plan.
  auto Plan() -> Result<PlanOutcome>;

  // Versions, compatibility and source selection without assembling a plan.
  auto PrepareContext() -> Result<RunContext>;

 private:
  auto Assemble(const RunContext& context) -> Result<InvocationPlan>;
  auto ResolveProcessorPath(const RunContext& context)
      -> std::vector<std::filesystem::path>;
  auto ResolveOverlay(
      const artifact::ArtifactCoordinate& coordinate, std::string_view purpose)
      -> std::optional<std::filesystem::path>;

  const config::BuildContext& build_;
  const config::CheckerOptions& options_;
  artifact::ArtifactResolver& resolver_;
  const version::HostRuntime& host_;
  std::shared_ptr<spdlog::logger> log_;
};

// Spawn the planned command, streaming each output line to the log:
// lines with an error marker as errors, warning markers as warnings.
auto Execute(
    const InvocationPlan& plan,
    const std::optional<std::filesystem::path>& working_dir,
    spdlog::logger& log) -> Result<ExecutionResult>;

// Plan, execute and interpret the exit status. A non-zero status is a
// kCheckerFailure diagnostic unless fail_on_error is off. Reference files
// are removed before this returns, whatever the outcome.
auto RunCheck(
    InvocationPlanner& planner, const config::CheckerOptions& options,
    const std::optional<std::filesystem::path>& working_dir,
    spdlog::logger& log) -> Result<RunOutcome>;

}  // namespace checkerlaunch::planner
