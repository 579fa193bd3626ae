#include "checkerlaunch/lombok/lombok.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::lombok {

namespace fs = std::filesystem;

namespace {

auto FindLombokPlugin(const config::BuildContext& build)
    -> const config::BuildPlugin* {
  return build.FindPlugin(kLombokGroup, kLombokPluginName);
}

auto ConfiguredOutput(const config::PluginConfiguration& configuration)
    -> std::optional<std::string> {
  auto it = configuration.find(kOutputDirectoryKey);
  if (it == configuration.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

auto ExecutionOutput(const config::BuildPlugin& plugin, std::string_view goal)
    -> std::optional<std::string> {
  for (const auto& execution : plugin.executions) {
    if (!execution.HasGoal(goal)) {
      continue;
    }
    if (auto output = ConfiguredOutput(execution.configuration)) {
      return output;
    }
  }
  return std::nullopt;
}

auto IsDirectory(const fs::path& path) -> bool {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

// Keys of a "-AsuppressWarnings=a,b" argument.
auto SuppressionKeys(std::string_view arg) -> std::vector<std::string_view> {
  std::vector<std::string_view> keys;
  auto eq = arg.find('=');
  if (eq == std::string_view::npos) {
    return keys;
  }
  std::string_view rest = arg.substr(eq + 1);
  while (!rest.empty()) {
    auto comma = rest.find(',');
    keys.push_back(rest.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  return keys;
}

}  // namespace

auto IsLombokUsed(const config::BuildContext& build) -> bool {
  return build.FindDependency(kLombokGroup, kLombokName) != nullptr ||
         FindLombokPlugin(build) != nullptr;
}

auto ResolveBuildPath(std::string expression, const config::BuildContext& build)
    -> fs::path {
  fs::path build_dir =
      build.build_dir.empty() ? build.base_dir / "target" : build.build_dir;
  expression = common::ReplaceAll(
      std::move(expression), kBuildDirectoryPlaceholder, build_dir.string());
  expression = common::ReplaceAll(
      std::move(expression), kBaseDirPlaceholder, build.base_dir.string());

  fs::path resolved = expression;
  if (resolved.is_relative()) {
    resolved = build.base_dir / resolved;
  }
  return resolved.lexically_normal();
}

auto FindDelombokOutputDirectory(const config::BuildContext& build)
    -> std::optional<fs::path> {
  const auto* plugin = FindLombokPlugin(build);
  if (plugin == nullptr) {
    return std::nullopt;
  }
  auto output = ExecutionOutput(*plugin, kDelombokGoal);
  if (!output) {
    output = ConfiguredOutput(plugin->configuration);
  }
  if (!output) {
    return std::nullopt;
  }
  return ResolveBuildPath(*output, build);
}

auto FindTestDelombokOutputDirectory(const config::BuildContext& build)
    -> std::optional<fs::path> {
  const auto* plugin = FindLombokPlugin(build);
  if (plugin == nullptr) {
    return std::nullopt;
  }
  auto output = ExecutionOutput(*plugin, kTestDelombokGoal);
  return ResolveBuildPath(output.value_or(kDefaultTestDelombokDir), build);
}

auto HasBuilderSensitiveChecker(const std::vector<std::string>& processors)
    -> bool {
  return std::ranges::any_of(processors, [](const std::string& processor) {
    return processor.find("ObjectConstructionChecker") != std::string::npos ||
           processor.find("CalledMethodsChecker") != std::string::npos;
  });
}

auto Detect(
    const config::BuildContext& build,
    const std::vector<std::string>& processors, spdlog::logger& log)
    -> LombokState {
  LombokState state;
  state.is_used = IsLombokUsed(build);
  if (!state.is_used) {
    return state;
  }

  log.info("Lombok detected; looking for delombok output");

  if (HasBuilderSensitiveChecker(processors)) {
    log.warn(
        "the Object Construction or Called Methods Checker is enabled; "
        "make sure lombok.config contains "
        "'lombok.addLombokGeneratedAnnotation = true', or warnings about "
        "misuse of Lombok builders will be disabled");
  }

  auto main_dir = FindDelombokOutputDirectory(build);
  if (main_dir && IsDirectory(*main_dir)) {
    log.info("using delombok output directory {}", main_dir->string());
    state.delombok_dir = std::move(main_dir);
  } else {
    log.warn(
        "Lombok is used but no delombok output directory was found{}; "
        "checking original sources, which may contain Lombok annotations",
        main_dir ? std::format(" at {}", main_dir->string()) : "");
  }

  auto test_dir = FindTestDelombokOutputDirectory(build);
  if (test_dir && IsDirectory(*test_dir)) {
    log.debug("using test delombok output directory {}", test_dir->string());
    state.test_delombok_dir = std::move(test_dir);
  }

  return state;
}

auto MergeSuppressWarnings(std::vector<std::string> args)
    -> std::vector<std::string> {
  for (auto& arg : args) {
    std::string_view view = arg;
    if (!view.starts_with(kSuppressWarningsPrefix)) {
      continue;
    }
    // -AsuppressWarnings or -AsuppressWarnings=..., not a longer key
    view.remove_prefix(kSuppressWarningsPrefix.size());
    if (!view.empty() && view.front() != '=') {
      continue;
    }
    auto keys = SuppressionKeys(arg);
    if (std::ranges::find(keys, kTypeAnnoBeforeModifier) != keys.end()) {
      return args;
    }
    if (arg.find('=') == std::string::npos) {
      arg += '=';
    } else if (!keys.empty() && !arg.ends_with(',')) {
      arg += ',';
    }
    arg += kTypeAnnoBeforeModifier;
    return args;
  }
  args.push_back(
      std::format("{}={}", kSuppressWarningsPrefix, kTypeAnnoBeforeModifier));
  return args;
}

}  // namespace checkerlaunch::lombok
