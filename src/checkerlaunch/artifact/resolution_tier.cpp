#include "checkerlaunch/artifact/resolution_tier.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/common/subprocess.hpp"

namespace checkerlaunch::artifact {

namespace fs = std::filesystem;

namespace {

auto IsRegularFile(const fs::path& path) -> bool {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

auto Found(const ArtifactCoordinate& coordinate, fs::path file)
    -> ResolvedArtifact {
  return ResolvedArtifact{
      .group = coordinate.group,
      .name = coordinate.name,
      .version = coordinate.version,
      .file = std::move(file),
  };
}

}  // namespace

auto DeclaredDependencyTier::Lookup(const ArtifactCoordinate& coordinate)
    -> TierResult {
  const auto* dep = build_.FindDependency(coordinate.group, coordinate.name);
  if (dep == nullptr || !dep->file || !IsRegularFile(*dep->file)) {
    return std::nullopt;
  }
  // A project-pinned version wins over the requested one.
  return ResolvedArtifact{
      .group = dep->group,
      .name = dep->name,
      .version = dep->version.empty() ? coordinate.version : dep->version,
      .file = *dep->file,
  };
}

auto LocalCacheTier::Lookup(const ArtifactCoordinate& coordinate)
    -> TierResult {
  if (root_.empty() || coordinate.version.empty()) {
    return std::nullopt;
  }
  auto path = RepositoryPath(root_, coordinate);
  if (!IsRegularFile(path)) {
    return std::nullopt;
  }
  return Found(coordinate, std::move(path));
}

auto CommandRemoteRepository::ExpandCommand(
    const ArtifactCoordinate& coordinate) const -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(command_template_.size());
  for (const auto& element : command_template_) {
    std::string arg = element;
    arg = common::ReplaceAll(
        std::move(arg), "{coordinate}", coordinate.ToString());
    arg = common::ReplaceAll(std::move(arg), "{group}", coordinate.group);
    arg = common::ReplaceAll(std::move(arg), "{name}", coordinate.name);
    arg = common::ReplaceAll(std::move(arg), "{version}", coordinate.version);
    argv.push_back(std::move(arg));
  }
  return argv;
}

auto CommandRemoteRepository::Retrieve(const ArtifactCoordinate& coordinate)
    -> std::expected<fs::path, std::string> {
  if (command_template_.empty()) {
    return std::unexpected("no fetch command configured");
  }
  auto result = common::RunSubprocess(ExpandCommand(coordinate));
  if (!result) {
    return std::unexpected(result.error().primary.message);
  }
  if (result->exit_code != 0) {
    return std::unexpected(
        std::format(
            "'{}' exited with status {}", command_template_.front(),
            result->exit_code));
  }
  auto path = RepositoryPath(local_root_, coordinate);
  if (!IsRegularFile(path)) {
    return std::unexpected(
        std::format("fetch succeeded but {} does not exist", path.string()));
  }
  return path;
}

auto RemoteTier::Lookup(const ArtifactCoordinate& coordinate) -> TierResult {
  if (coordinate.version.empty()) {
    return std::nullopt;
  }
  auto path = repository_->Retrieve(coordinate);
  if (!path) {
    return std::unexpected(path.error());
  }
  return Found(coordinate, std::move(*path));
}

auto InstalledMarkerLocator::Locate() const -> std::optional<std::string> {
  if (const char* env_path = std::getenv("CHECKERLAUNCH_CHECKER_JAR")) {
    if (*env_path != '\0') {
      return std::string(env_path);
    }
  }

  std::error_code ec;
  fs::path exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (ec || exe_path.empty()) {
    return std::nullopt;
  }
  fs::path exe_dir = exe_path.parent_path();
  for (const auto& candidate :
       {exe_dir.parent_path() / "share" / "checkerlaunch" / "checker.jar",
        exe_dir / "checker.jar"}) {
    if (IsRegularFile(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

auto MarkerResourceTier::Lookup(const ArtifactCoordinate& coordinate)
    -> TierResult {
  if (coordinate.group != group_ || coordinate.name != name_) {
    return std::nullopt;
  }
  auto location = locator_->Locate();
  if (!location) {
    return std::nullopt;
  }
  auto path = LocationToPath(*location);
  if (!path || !IsRegularFile(*path)) {
    return std::unexpected(
        std::format("marker location '{}' is not a file", *location));
  }
  return Found(coordinate, std::move(*path));
}

}  // namespace checkerlaunch::artifact
