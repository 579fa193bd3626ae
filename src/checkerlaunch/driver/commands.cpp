#include "commands.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/logger.h>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/artifact/resolution_tier.hpp"
#include "checkerlaunch/artifact/resolver.hpp"
#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/common/log.hpp"
#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/compat/compatibility.hpp"
#include "checkerlaunch/config/project_config.hpp"
#include "checkerlaunch/planner/invocation_plan.hpp"
#include "checkerlaunch/planner/planner.hpp"
#include "checkerlaunch/version/version.hpp"
#include "print.hpp"

namespace checkerlaunch::driver {

namespace {

namespace fs = std::filesystem;

// Everything one subcommand needs, kept at stable addresses because the
// planner holds references into it.
struct Session {
  config::ProjectConfig config;
  std::shared_ptr<spdlog::logger> log;
  std::unique_ptr<artifact::ArtifactResolver> resolver;
  std::unique_ptr<version::ExecutableHostRuntime> host;
};

auto LocateConfig(const argparse::ArgumentParser& cmd) -> Result<fs::path> {
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    if (!fs::exists(*explicit_path)) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format("config file '{}' does not exist", *explicit_path)));
    }
    return fs::path(*explicit_path);
  }
  auto found = config::FindConfig(fs::current_path());
  if (!found) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "no {} found in this directory or any parent",
                config::kConfigFileName))
            .WithNote("use --config <file> or -C <dir>"));
  }
  return *found;
}

// Scalars replace the file's values; lists append to them.
void ApplyCliOptions(
    const argparse::ArgumentParser& cmd, config::CheckerOptions& options) {
  if (auto processors = cmd.present<std::vector<std::string>>("--processor")) {
    options.processors.insert(
        options.processors.end(), processors->begin(), processors->end());
  }
  if (auto version = cmd.present<std::string>("--checker-version")) {
    options.checker_version = *version;
  }
  if (auto args = cmd.present<std::vector<std::string>>("-A")) {
    for (const auto& arg : *args) {
      options.extra_args.push_back("-A" + arg);
    }
  }
  if (auto executable = cmd.present<std::string>("--executable")) {
    options.executable = *executable;
  }
  if (cmd.get<bool>("--skip")) {
    options.skip = true;
  }
  if (cmd.get<bool>("--no-fail-on-error")) {
    options.fail_on_error = false;
  }
  if (cmd.get<bool>("--include-tests")) {
    options.exclude_tests = false;
  }
  if (cmd.get<bool>("--no-proc-only")) {
    options.proc_only = false;
  }
}

auto BuildTiers(const config::ProjectConfig& config)
    -> std::vector<std::unique_ptr<artifact::ResolutionTier>> {
  std::vector<std::unique_ptr<artifact::ResolutionTier>> tiers;
  tiers.push_back(
      std::make_unique<artifact::DeclaredDependencyTier>(config.build));
  if (!config.repository.local.empty()) {
    tiers.push_back(
        std::make_unique<artifact::LocalCacheTier>(config.repository.local));
    if (!config.repository.fetch_command.empty()) {
      tiers.push_back(
          std::make_unique<artifact::RemoteTier>(
              std::make_unique<artifact::CommandRemoteRepository>(
                  config.repository.fetch_command, config.repository.local)));
    }
  }
  tiers.push_back(
      std::make_unique<artifact::MarkerResourceTier>(
          artifact::kCheckerGroup, artifact::kCheckerName,
          std::make_unique<artifact::InstalledMarkerLocator>()));
  return tiers;
}

auto OpenSession(const argparse::ArgumentParser& cmd)
    -> Result<std::unique_ptr<Session>> {
  auto config_path = LocateConfig(cmd);
  if (!config_path) {
    return std::unexpected(std::move(config_path.error()));
  }
  auto config = config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }

  auto session = std::make_unique<Session>();
  session->config = std::move(*config);
  ApplyCliOptions(cmd, session->config.options);

  session->log = common::MakeConsoleLogger(cmd.get<bool>("-v"));
  session->log->debug("loaded {}", session->config.config_path.string());
  session->resolver = std::make_unique<artifact::ArtifactResolver>(
      BuildTiers(session->config), session->log);
  session->host = std::make_unique<version::ExecutableHostRuntime>(
      planner::ResolveExecutable(
          session->config.options.executable, session->config.build));
  return session;
}

auto ExitCodeFor(const Diagnostic& diag) -> int {
  return diag.primary.kind == DiagKind::kCheckerFailure ? kExitCheckerFailure
                                                        : kExitError;
}

auto YesNo(bool value) -> const char* {
  return value ? "yes" : "no";
}

}  // namespace

void AddProjectFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config")
      .help("Project description (default: nearest checker.toml)")
      .metavar("file");
  cmd.add_argument("--processor")
      .append()
      .help("Annotation processor class (repeatable)");
  cmd.add_argument("--checker-version").help("Checker Framework version");
  cmd.add_argument("-A").append().help(
      "Processor option, passed as -A<value> (repeatable)");
  cmd.add_argument("--executable").help("Compiler executable (javac or java)");
  cmd.add_argument("--skip")
      .default_value(false)
      .implicit_value(true)
      .help("Skip the checker run");
  cmd.add_argument("--no-fail-on-error")
      .default_value(false)
      .implicit_value(true)
      .help("Report checker errors without failing");
  cmd.add_argument("--include-tests")
      .default_value(false)
      .implicit_value(true)
      .help("Also check test source roots");
  cmd.add_argument("--no-proc-only")
      .default_value(false)
      .implicit_value(true)
      .help("Compile as well as run annotation processing");
  cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Debug logging");
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto session = OpenSession(cmd);
  if (!session) {
    PrintDiagnostic(session.error());
    return kExitError;
  }
  auto& s = **session;

  planner::InvocationPlanner invocation_planner(
      s.config.build, s.config.options, *s.resolver, *s.host, s.log);
  auto outcome = planner::RunCheck(
      invocation_planner, s.config.options, s.config.build.base_dir, *s.log);
  if (!outcome) {
    PrintDiagnostic(outcome.error());
    return ExitCodeFor(outcome.error());
  }
  if (*outcome == planner::RunOutcome::kFailedReported) {
    PrintWarning("checker reported errors; fail_on_error is disabled");
  }
  return kExitSuccess;
}

auto PlanCommand(const argparse::ArgumentParser& cmd) -> int {
  auto session = OpenSession(cmd);
  if (!session) {
    PrintDiagnostic(session.error());
    return kExitError;
  }
  auto& s = **session;

  planner::InvocationPlanner invocation_planner(
      s.config.build, s.config.options, *s.resolver, *s.host, s.log);
  auto outcome = invocation_planner.Plan();
  if (!outcome) {
    PrintDiagnostic(outcome.error());
    return ExitCodeFor(outcome.error());
  }
  if (const auto* skipped = std::get_if<planner::SkippedRun>(&*outcome)) {
    std::cout << std::format("skipped: {}\n", skipped->reason);
    return kExitSuccess;
  }

  const auto& plan = std::get<planner::InvocationPlan>(*outcome);
  for (size_t i = 0; i < planner::kSectionCount; ++i) {
    auto section = static_cast<planner::Section>(i);
    auto tokens = plan.SectionTokens(section);
    if (!tokens.empty()) {
      s.log->debug(
          "{}: {}", planner::SectionName(section), common::Join(tokens, " "));
    }
  }
  std::cout << plan.ToShellString() << "\n";
  for (const auto& file : plan.ReferenceFiles()) {
    s.log->debug("{} (removed on exit)", file.Path().string());
  }
  return kExitSuccess;
}

auto VersionsCommand(const argparse::ArgumentParser& cmd) -> int {
  auto session = OpenSession(cmd);
  if (!session) {
    PrintDiagnostic(session.error());
    return kExitError;
  }
  auto& s = **session;
  const auto& build = s.config.build;
  const auto& options = s.config.options;

  auto versions = version::DetectVersions(build, *s.host);
  if (!versions) {
    PrintDiagnostic(versions.error());
    return kExitError;
  }
  auto checker_version = planner::SelectCheckerVersion(build, options);
  auto decision = compat::Decide(
      *versions, version::ParseCheckerVersion(checker_version));

  std::cout << std::format(
      "source version:          {}\n"
      "runtime version:         {}\n"
      "checker version:         {}\n"
      "executable:              {}\n"
      "module visibility flags: {}\n"
      "alternate frontend:      {}\n"
      "annotated stdlib:        {}\n",
      versions->source, versions->runtime, checker_version,
      planner::ResolveExecutable(options.executable, build),
      YesNo(decision.needs_module_visibility_flags),
      YesNo(decision.needs_alternate_frontend),
      YesNo(decision.needs_annotated_stdlib));
  return kExitSuccess;
}

}  // namespace checkerlaunch::driver
