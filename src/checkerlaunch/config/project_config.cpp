#include "checkerlaunch/config/project_config.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::config {

namespace fs = std::filesystem;

namespace {

template <typename View>
auto ReadStringArray(View node) -> std::vector<std::string> {
  std::vector<std::string> result;
  if (const auto* arr = node.as_array()) {
    for (const auto& elem : *arr) {
      if (auto str = elem.value<std::string>()) {
        result.push_back(*str);
      }
    }
  }
  return result;
}

// Flatten a table of scalars into strings; nested tables are ignored.
template <typename View>
auto ReadStringTable(View node) -> std::map<std::string, std::string> {
  std::map<std::string, std::string> result;
  const auto* tbl = node.as_table();
  if (tbl == nullptr) {
    return result;
  }
  for (const auto& [key, value] : *tbl) {
    if (auto str = value.value<std::string>()) {
      result.emplace(std::string(key.str()), *str);
    } else if (auto num = value.value<int64_t>()) {
      result.emplace(std::string(key.str()), std::to_string(*num));
    } else if (auto flag = value.value<bool>()) {
      result.emplace(std::string(key.str()), *flag ? "true" : "false");
    }
  }
  return result;
}

auto ResolveAgainst(const fs::path& base, const std::string& raw) -> fs::path {
  fs::path path = raw;
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

void LoadSources(
    const toml::table& tbl, const fs::path& base, BuildContext& build) {
  const auto* arr = tbl["sources"].as_array();
  if (arr == nullptr) {
    return;
  }
  for (const auto& elem : *arr) {
    const auto* entry = elem.as_table();
    if (entry == nullptr) {
      continue;
    }
    auto path = (*entry)["path"].value<std::string>();
    if (!path) {
      continue;
    }
    SourceRoot root;
    root.path = ResolveAgainst(base, *path);
    root.scope = (*entry)["scope"].value_or<std::string>("main") == "test"
                     ? SourceScope::kTest
                     : SourceScope::kMain;
    root.enabled = (*entry)["enabled"].value_or(true);
    build.source_roots.push_back(std::move(root));
  }
}

void LoadDependencies(
    const toml::table& tbl, const fs::path& base, BuildContext& build) {
  const auto* arr = tbl["dependencies"].as_array();
  if (arr == nullptr) {
    return;
  }
  for (const auto& elem : *arr) {
    const auto* entry = elem.as_table();
    if (entry == nullptr) {
      continue;
    }
    DeclaredArtifact dep;
    dep.group = (*entry)["group"].value_or<std::string>("");
    dep.name = (*entry)["name"].value_or<std::string>("");
    dep.version = (*entry)["version"].value_or<std::string>("");
    if (auto file = (*entry)["file"].value<std::string>()) {
      dep.file = ResolveAgainst(base, *file);
    }
    build.dependencies.push_back(std::move(dep));
  }
}

void LoadPlugins(const toml::table& tbl, BuildContext& build) {
  const auto* arr = tbl["plugins"].as_array();
  if (arr == nullptr) {
    return;
  }
  for (const auto& elem : *arr) {
    const auto* entry = elem.as_table();
    if (entry == nullptr) {
      continue;
    }
    toml::node_view<const toml::node> view{entry};
    BuildPlugin plugin;
    plugin.group = view["group"].value_or<std::string>("");
    plugin.name = view["name"].value_or<std::string>("");
    plugin.configuration = ReadStringTable(view["configuration"]);
    if (const auto* executions = view["executions"].as_array()) {
      for (const auto& exec_elem : *executions) {
        if (exec_elem.as_table() == nullptr) {
          continue;
        }
        toml::node_view<const toml::node> exec_view{&exec_elem};
        plugin.executions.push_back(
            PluginExecution{
                .id = exec_view["id"].value_or<std::string>(""),
                .goals = ReadStringArray(exec_view["goals"]),
                .configuration = ReadStringTable(exec_view["configuration"]),
            });
      }
    }
    build.plugins.push_back(std::move(plugin));
  }
}

void LoadCheckerOptions(const toml::table& tbl, CheckerOptions& options) {
  auto checker = tbl["checker"];
  if (!checker) {
    return;
  }
  options.processors = ReadStringArray(checker["processors"]);
  if (auto version = checker["version"].value<std::string>()) {
    options.checker_version = *version;
  }
  options.extra_args = ReadStringArray(checker["extra_args"]);
  options.skip = checker["skip"].value_or(options.skip);
  options.proc_only = checker["proc_only"].value_or(options.proc_only);
  options.fail_on_error =
      checker["fail_on_error"].value_or(options.fail_on_error);
  options.exclude_tests =
      checker["exclude_tests"].value_or(options.exclude_tests);
  options.suppress_lombok_warnings = checker["suppress_lombok_warnings"]
                                         .value_or(
                                             options.suppress_lombok_warnings);
  options.executable =
      checker["executable"].value_or(options.executable);
  options.includes = ReadStringArray(checker["includes"]);
  options.excludes = ReadStringArray(checker["excludes"]);
}

}  // namespace

auto DefaultLocalRepository() -> fs::path {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return {};
  }
  return fs::path(home) / ".m2" / "repository";
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.config_path = fs::absolute(config_path);
  fs::path config_dir = config.config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [project] section
  auto project = tbl["project"];
  if (!project) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "{}: missing [project] section", config_path.string())));
  }

  BuildContext& build = config.build;
  build.name = project["name"].value_or<std::string>(
      config_dir.filename().string());
  build.packaging = project["packaging"].value_or<std::string>("jar");
  build.base_dir = config_dir;
  if (auto base = project["basedir"].value<std::string>()) {
    build.base_dir = ResolveAgainst(config_dir, *base);
  }
  build.build_dir = ResolveAgainst(
      build.base_dir,
      project["build_directory"].value_or<std::string>("target"));
  for (const auto& element : ReadStringArray(project["classpath"])) {
    build.classpath.push_back(ResolveAgainst(build.base_dir, element).string());
  }

  build.properties = ReadStringTable(tbl["properties"]);
  LoadSources(tbl, build.base_dir, build);
  LoadDependencies(tbl, build.base_dir, build);
  LoadPlugins(tbl, build);

  // [toolchain] section (optional)
  if (auto toolchain = tbl["toolchain"]) {
    auto jdk_home = toolchain["jdk_home"].value<std::string>();
    if (!jdk_home) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: [toolchain] requires 'jdk_home'",
                  config_path.string())));
    }
    build.toolchain = std::make_shared<JdkToolchain>(
        ResolveAgainst(build.base_dir, *jdk_home),
        toolchain["version"].value<std::string>());
  }

  // [repository] section (optional)
  config.repository.local = DefaultLocalRepository();
  if (auto repository = tbl["repository"]) {
    if (auto local = repository["local"].value<std::string>()) {
      config.repository.local = ResolveAgainst(build.base_dir, *local);
    }
    config.repository.fetch_command =
        ReadStringArray(repository["fetch_command"]);
  }

  LoadCheckerOptions(tbl, config.options);

  return config;
}

}  // namespace checkerlaunch::config
