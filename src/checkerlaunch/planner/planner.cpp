#include "checkerlaunch/planner/planner.hpp"

#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/artifact/resolver.hpp"
#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/common/internal_error.hpp"
#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/common/subprocess.hpp"
#include "checkerlaunch/compat/compatibility.hpp"
#include "checkerlaunch/config/build_context.hpp"
#include "checkerlaunch/config/project_config.hpp"
#include "checkerlaunch/lombok/lombok.hpp"
#include "checkerlaunch/planner/argument_file.hpp"
#include "checkerlaunch/planner/invocation_plan.hpp"
#include "checkerlaunch/planner/source_set.hpp"
#include "checkerlaunch/version/version.hpp"

namespace checkerlaunch::planner {

namespace fs = std::filesystem;

namespace {

auto JoinPaths(const std::vector<fs::path>& paths) -> std::string {
  std::vector<std::string> parts;
  parts.reserve(paths.size());
  for (const auto& path : paths) {
    parts.push_back(path.string());
  }
  return common::Join(parts, ":");
}

}  // namespace

auto ResolveExecutable(
    const std::string& executable, const config::BuildContext& build)
    -> std::string {
  std::error_code ec;
  if (fs::exists(executable, ec)) {
    return fs::absolute(executable, ec).string();
  }
  if (build.toolchain) {
    if (auto tool = build.toolchain->FindTool(executable)) {
      return tool->string();
    }
  }
  return executable;
}

auto IsLauncher(std::string_view executable) -> bool {
  return fs::path(executable).stem() == "java";
}

auto SelectCheckerVersion(
    const config::BuildContext& build, const config::CheckerOptions& options)
    -> std::string {
  if (options.checker_version && !options.checker_version->empty()) {
    return *options.checker_version;
  }
  const auto* qual =
      build.FindDependency(artifact::kCheckerGroup, artifact::kCheckerQualName);
  if (qual != nullptr && !qual->version.empty()) {
    return qual->version;
  }
  return artifact::kDefaultCheckerVersion;
}

auto ModuleVisibilityFlags(bool launcher_mode) -> std::vector<std::string> {
  std::string_view prefix = launcher_mode ? "" : "-J";
  std::vector<std::string> flags;
  flags.reserve(compat::kExportedCompilerPackages.size() + 1);
  for (auto package : compat::kExportedCompilerPackages) {
    flags.push_back(std::format("{}--add-exports={}", prefix, package));
  }
  flags.push_back(
      std::format("{}--add-opens={}", prefix, compat::kOpenedCompilerPackage));
  return flags;
}

auto SkipReason(
    const config::BuildContext& build, const config::CheckerOptions& options)
    -> std::optional<std::string> {
  if (options.skip) {
    return "checker execution is skipped";
  }
  if (build.packaging == kAggregatorPackaging) {
    return std::format(
        "skipping project '{}' with packaging '{}'", build.name,
        build.packaging);
  }
  if (options.processors.empty()) {
    return "no checkers configured";
  }
  return std::nullopt;
}

InvocationPlanner::InvocationPlanner(
    const config::BuildContext& build, const config::CheckerOptions& options,
    artifact::ArtifactResolver& resolver, const version::HostRuntime& host,
    std::shared_ptr<spdlog::logger> log)
    : build_(build),
      options_(options),
      resolver_(resolver),
      host_(host),
      log_(std::move(log)) {
}

auto InvocationPlanner::PrepareContext() -> Result<RunContext> {
  auto versions = version::DetectVersions(build_, host_);
  if (!versions) {
    return std::unexpected(std::move(versions.error()));
  }

  RunContext context{
      .versions = *versions,
      .checker_version = SelectCheckerVersion(build_, options_),
      .decision = {},
      .lombok = {},
      .executable = ResolveExecutable(options_.executable, build_),
      .launcher_mode = false,
      .sources = {},
  };
  context.launcher_mode = IsLauncher(context.executable);

  auto parsed = version::ParseCheckerVersion(context.checker_version);
  if (!parsed) {
    log_->debug(
        "checker version '{}' is not in major.minor form",
        context.checker_version);
  }
  context.decision = compat::Decide(context.versions, parsed);

  log_->debug(
      "source version {}, runtime version {}, checker version {}",
      context.versions.source, context.versions.runtime,
      context.checker_version);
  log_->debug(
      "module flags: {}, alternate frontend: {}, annotated stdlib: {}",
      context.decision.needs_module_visibility_flags,
      context.decision.needs_alternate_frontend,
      context.decision.needs_annotated_stdlib);

  context.lombok = lombok::Detect(build_, options_.processors, *log_);

  auto roots =
      SelectSourceRoots(build_, context.lombok, options_.exclude_tests);
  context.sources =
      ScanSources(roots, options_.includes, options_.excludes, *log_);
  return context;
}

auto InvocationPlanner::Plan() -> Result<PlanOutcome> {
  if (auto reason = SkipReason(build_, options_)) {
    if (options_.processors.empty() && !options_.skip) {
      log_->warn("{}", *reason);
    } else {
      log_->info("{}", *reason);
    }
    return PlanOutcome{SkippedRun{.reason = std::move(*reason)}};
  }

  log_->info(
      "running processor(s): {}", common::Join(options_.processors, ", "));

  auto context = PrepareContext();
  if (!context) {
    return std::unexpected(std::move(context.error()));
  }
  if (context->sources.empty()) {
    log_->info("no source files found");
    return PlanOutcome{SkippedRun{.reason = "no source files found"}};
  }
  log_->debug("{} source file(s) selected", context->sources.size());

  auto plan = Assemble(*context);
  if (!plan) {
    return std::unexpected(std::move(plan.error()));
  }
  return PlanOutcome{std::move(*plan)};
}

auto InvocationPlanner::ResolveProcessorPath(const RunContext& context)
    -> std::vector<fs::path> {
  auto set = resolver_.ResolveAll({
      {.group = artifact::kCheckerGroup,
       .name = artifact::kCheckerName,
       .version = context.checker_version},
      {.group = artifact::kCheckerGroup,
       .name = artifact::kCheckerQualName,
       .version = context.checker_version},
  });
  // javac looks up -processor classes only on the processor path, so a
  // path without the checker runtime itself would hide a copy on the
  // compile classpath. Qualifiers alone are not a usable processor path.
  if (!set.Contains(artifact::kCheckerGroup, artifact::kCheckerName)) {
    log_->warn(
        "checker runtime not found; relying on the compile classpath for "
        "processors");
    return {};
  }
  if (set.Degraded()) {
    for (const auto& coordinate : set.missing) {
      log_->warn(
          "{} not found; processor path is incomplete", coordinate.ToString());
    }
  }
  return set.Paths();
}

auto InvocationPlanner::ResolveOverlay(
    const artifact::ArtifactCoordinate& coordinate, std::string_view purpose)
    -> std::optional<fs::path> {
  auto resolved = resolver_.Resolve(coordinate);
  if (!resolved.Found()) {
    log_->warn(
        "{} is required for {} but could not be resolved; continuing "
        "without it",
        coordinate.ToString(), purpose);
    return std::nullopt;
  }
  return resolved.file;
}

auto InvocationPlanner::Assemble(const RunContext& context)
    -> Result<InvocationPlan> {
  InvocationPlanBuilder builder;
  builder.Executable(context.executable);

  if (context.decision.needs_module_visibility_flags) {
    builder.ModuleVisibility(ModuleVisibilityFlags(context.launcher_mode));
  }

  if (context.decision.needs_alternate_frontend) {
    auto frontend = ResolveOverlay(
        {.group = artifact::kAlternateFrontendGroup,
         .name = artifact::kAlternateFrontendName,
         .version = artifact::kAlternateFrontendVersion},
        "the Java 8 compiler frontend");
    if (frontend) {
      builder.AlternateFrontend(
          std::format(
              "{}{}{}", context.launcher_mode ? "" : "-J",
              kBootClasspathPrepend, frontend->string()));
    }
  }

  auto processor_path = ResolveProcessorPath(context);

  if (context.launcher_mode) {
    if (!processor_path.empty()) {
      builder.JvmClasspath(JoinPaths(processor_path));
    }
    builder.MainEntry(kJavacMainClass);
  }

  if (context.decision.needs_annotated_stdlib) {
    auto stdlib = ResolveOverlay(
        {.group = artifact::kCheckerGroup,
         .name = artifact::kAnnotatedJdkName,
         .version = context.checker_version},
        "the annotated JDK");
    if (stdlib) {
      builder.AnnotatedStdlib(
          std::format("{}{}", kBootClasspathPrepend, stdlib->string()));
    }
  }

  if (!build_.classpath.empty()) {
    auto classpath_file = ArgumentFile::Create(
        "checkerlaunch-cp", ".classpath", ClasspathFileLines(build_.classpath));
    if (!classpath_file) {
      return std::unexpected(std::move(classpath_file.error()));
    }
    builder.ClasspathReference(std::move(*classpath_file));
  }

  if (!processor_path.empty()) {
    builder.ProcessorPath(JoinPaths(processor_path));
  }
  builder.Processors(options_.processors);

  if (options_.proc_only) {
    builder.ProcessingMode(kProcOnlyFlag);
  }

  auto extra_args = options_.extra_args;
  if (context.lombok.is_used && options_.suppress_lombok_warnings) {
    extra_args = lombok::MergeSuppressWarnings(std::move(extra_args));
  }
  if (!extra_args.empty()) {
    builder.ExtraArgs(std::move(extra_args));
  }

  auto source_file = ArgumentFile::Create(
      "checkerlaunch-src", ".src_files", SourceFileLines(context.sources));
  if (!source_file) {
    return std::unexpected(std::move(source_file.error()));
  }
  builder.SourceReference(std::move(*source_file));

  return std::move(builder).Build();
}

auto Execute(
    const InvocationPlan& plan, const std::optional<fs::path>& working_dir,
    spdlog::logger& log) -> Result<ExecutionResult> {
  if (plan.Arguments().empty()) {
    common::ThrowInternalError("Execute", "invocation plan has no arguments");
  }
  log.info("running: {}", plan.ToShellString());

  ExecutionResult result{.exit_code = 0, .error_lines = 0, .warning_lines = 0};
  auto on_line = [&](std::string_view line) {
    if (line.find(kErrorMarker) != std::string_view::npos) {
      ++result.error_lines;
      log.error("{}", line);
    } else if (line.find(kWarningMarker) != std::string_view::npos) {
      ++result.warning_lines;
      log.warn("{}", line);
    } else {
      log.info("{}", line);
    }
  };

  auto run = common::RunSubprocess(plan.Arguments(), working_dir, on_line);
  if (!run) {
    return std::unexpected(
        std::move(run.error())
            .WithNote(
                std::format(
                    "while starting '{}'", plan.Arguments().front())));
  }
  result.exit_code = run->exit_code;
  return result;
}

auto RunCheck(
    InvocationPlanner& planner, const config::CheckerOptions& options,
    const std::optional<fs::path>& working_dir, spdlog::logger& log)
    -> Result<RunOutcome> {
  try {
    auto outcome = planner.Plan();
    if (!outcome) {
      return std::unexpected(std::move(outcome.error()));
    }
    if (std::holds_alternative<SkippedRun>(*outcome)) {
      return RunOutcome::kSkipped;
    }

    const auto& plan = std::get<InvocationPlan>(*outcome);
    auto result = Execute(plan, working_dir, log);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }

    if (result->exit_code == 0) {
      log.info("type checking completed without errors");
      return RunOutcome::kPassed;
    }

    auto message = std::format(
        "checker reported errors (exit status {}, {} error line(s))",
        result->exit_code, result->error_lines);
    if (options.fail_on_error) {
      return std::unexpected(Diagnostic::CheckerFailure(std::move(message)));
    }
    log.warn("{}; continuing because fail_on_error is off", message);
    return RunOutcome::kFailedReported;
  } catch (const std::exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("unexpected failure while running checker: {}",
                        e.what())));
  }
}

}  // namespace checkerlaunch::planner
