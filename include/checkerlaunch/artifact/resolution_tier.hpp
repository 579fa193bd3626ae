#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::artifact {

// nullopt: the tier has nothing for this coordinate.
// error:   the tier failed; the resolver logs it and moves on.
using TierResult = std::expected<std::optional<ResolvedArtifact>, std::string>;

// One source of artifacts, consulted in priority order by ArtifactResolver.
class ResolutionTier {
 public:
  virtual ~ResolutionTier() = default;

  [[nodiscard]] virtual auto Name() const -> std::string_view = 0;
  virtual auto Lookup(const ArtifactCoordinate& coordinate) -> TierResult = 0;
};

// Dependencies the build already resolved. A match on (group, name) with a
// file on disk wins, and its version replaces the requested one.
class DeclaredDependencyTier final : public ResolutionTier {
 public:
  explicit DeclaredDependencyTier(const config::BuildContext& build)
      : build_(build) {
  }

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "declared dependencies";
  }
  auto Lookup(const ArtifactCoordinate& coordinate) -> TierResult override;

 private:
  const config::BuildContext& build_;
};

// Existence check in the local repository. Never touches the network.
class LocalCacheTier final : public ResolutionTier {
 public:
  explicit LocalCacheTier(std::filesystem::path root)
      : root_(std::move(root)) {
  }

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "local cache";
  }
  auto Lookup(const ArtifactCoordinate& coordinate) -> TierResult override;

 private:
  std::filesystem::path root_;
};

// The build system's repository-resolution facility.
class RemoteRepository {
 public:
  virtual ~RemoteRepository() = default;

  // Fetch the artifact and return where it landed.
  virtual auto Retrieve(const ArtifactCoordinate& coordinate)
      -> std::expected<std::filesystem::path, std::string> = 0;
};

// Runs a configured fetch command, then looks for the jar in the local
// repository. Placeholders {group}, {name}, {version} and {coordinate} are
// substituted in every argv element.
class CommandRemoteRepository final : public RemoteRepository {
 public:
  CommandRemoteRepository(
      std::vector<std::string> command_template,
      std::filesystem::path local_root)
      : command_template_(std::move(command_template)),
        local_root_(std::move(local_root)) {
  }

  auto Retrieve(const ArtifactCoordinate& coordinate)
      -> std::expected<std::filesystem::path, std::string> override;

  [[nodiscard]] auto ExpandCommand(const ArtifactCoordinate& coordinate) const
      -> std::vector<std::string>;

 private:
  std::vector<std::string> command_template_;
  std::filesystem::path local_root_;
};

class RemoteTier final : public ResolutionTier {
 public:
  explicit RemoteTier(std::unique_ptr<RemoteRepository> repository)
      : repository_(std::move(repository)) {
  }

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "remote repository";
  }
  auto Lookup(const ArtifactCoordinate& coordinate) -> TierResult override;

 private:
  std::unique_ptr<RemoteRepository> repository_;
};

// Locates the file backing a known marker resource, as a path or URL.
class MarkerLocator {
 public:
  virtual ~MarkerLocator() = default;

  [[nodiscard]] virtual auto Locate() const -> std::optional<std::string> = 0;
};

// The checker runtime shipped with the launcher. Search order:
//   1. CHECKERLAUNCH_CHECKER_JAR environment variable (path or URL)
//   2. <exe dir>/../share/checkerlaunch/checker.jar
//   3. <exe dir>/checker.jar
class InstalledMarkerLocator final : public MarkerLocator {
 public:
  [[nodiscard]] auto Locate() const -> std::optional<std::string> override;
};

// Last resort for exactly one designated (group, name).
class MarkerResourceTier final : public ResolutionTier {
 public:
  MarkerResourceTier(
      std::string group, std::string name,
      std::unique_ptr<MarkerLocator> locator)
      : group_(std::move(group)),
        name_(std::move(name)),
        locator_(std::move(locator)) {
  }

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "bundled runtime";
  }
  auto Lookup(const ArtifactCoordinate& coordinate) -> TierResult override;

 private:
  std::string group_;
  std::string name_;
  std::unique_ptr<MarkerLocator> locator_;
};

}  // namespace checkerlaunch::artifact
