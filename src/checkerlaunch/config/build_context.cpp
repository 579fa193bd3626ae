#include "checkerlaunch/config/build_context.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace checkerlaunch::config {

namespace fs = std::filesystem;

auto PluginExecution::HasGoal(std::string_view goal) const -> bool {
  return std::ranges::find(goals, goal) != goals.end();
}

auto JdkToolchain::FindTool(std::string_view name) const
    -> std::optional<fs::path> {
  auto tool = jdk_home_ / "bin" / std::string(name);
  if (fs::exists(tool)) {
    return tool;
  }
  return std::nullopt;
}

auto BuildContext::FindDependency(
    std::string_view group, std::string_view name) const
    -> const DeclaredArtifact* {
  auto it = std::ranges::find_if(dependencies, [&](const auto& dep) {
    return dep.group == group && dep.name == name;
  });
  return it == dependencies.end() ? nullptr : &*it;
}

auto BuildContext::FindPlugin(
    std::string_view group, std::string_view name) const -> const BuildPlugin* {
  auto it = std::ranges::find_if(plugins, [&](const auto& plugin) {
    return plugin.group == group && plugin.name == name;
  });
  return it == plugins.end() ? nullptr : &*it;
}

auto BuildContext::Property(const std::string& key) const
    -> std::optional<std::string> {
  auto it = properties.find(key);
  if (it == properties.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace checkerlaunch::config
