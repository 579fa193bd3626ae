#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace checkerlaunch::config {

enum class SourceScope : uint8_t { kMain, kTest };

struct SourceRoot {
  std::filesystem::path path;
  SourceScope scope = SourceScope::kMain;
  bool enabled = true;
};

// A dependency the build system has already resolved. `file` is absent when
// the artifact was declared but never materialized on disk.
struct DeclaredArtifact {
  std::string group;
  std::string name;
  std::string version;
  std::optional<std::filesystem::path> file;
};

using PluginConfiguration = std::map<std::string, std::string>;

struct PluginExecution {
  std::string id;
  std::vector<std::string> goals;
  PluginConfiguration configuration;

  [[nodiscard]] auto HasGoal(std::string_view goal) const -> bool;
};

struct BuildPlugin {
  std::string group;
  std::string name;
  PluginConfiguration configuration;
  std::vector<PluginExecution> executions;
};

// A JDK selected by the build. Version() is an optional capability: a
// toolchain may be configured without advertising its version.
class Toolchain {
 public:
  virtual ~Toolchain() = default;

  // Path to a tool inside the toolchain, if present.
  [[nodiscard]] virtual auto FindTool(std::string_view name) const
      -> std::optional<std::filesystem::path> = 0;

  // Raw version string, or nullopt when the capability is absent.
  [[nodiscard]] virtual auto Version() const -> std::optional<std::string> = 0;
};

class JdkToolchain final : public Toolchain {
 public:
  JdkToolchain(
      std::filesystem::path jdk_home, std::optional<std::string> version)
      : jdk_home_(std::move(jdk_home)), version_(std::move(version)) {
  }

  [[nodiscard]] auto FindTool(std::string_view name) const
      -> std::optional<std::filesystem::path> override;
  [[nodiscard]] auto Version() const -> std::optional<std::string> override {
    return version_;
  }
  [[nodiscard]] auto JdkHome() const -> const std::filesystem::path& {
    return jdk_home_;
  }

 private:
  std::filesystem::path jdk_home_;
  std::optional<std::string> version_;
};

// Read-only view of the project being checked. Owned by the build system;
// the launcher never mutates it.
struct BuildContext {
  std::string name;
  std::string packaging = "jar";
  std::filesystem::path base_dir;
  std::filesystem::path build_dir;
  std::vector<SourceRoot> source_roots;
  std::vector<DeclaredArtifact> dependencies;
  std::vector<BuildPlugin> plugins;
  std::map<std::string, std::string> properties;
  std::vector<std::string> classpath;
  std::shared_ptr<const Toolchain> toolchain;

  [[nodiscard]] auto FindDependency(
      std::string_view group, std::string_view name) const
      -> const DeclaredArtifact*;
  [[nodiscard]] auto FindPlugin(
      std::string_view group, std::string_view name) const
      -> const BuildPlugin*;
  [[nodiscard]] auto Property(const std::string& key) const
      -> std::optional<std::string>;
};

}  // namespace checkerlaunch::config
