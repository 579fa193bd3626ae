#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/artifact/resolution_tier.hpp"

namespace checkerlaunch::artifact {

// Result of resolving several co-required artifacts. A partial result is
// usable; callers decide whether the missing ones matter.
struct ResolutionSet {
  std::vector<ResolvedArtifact> found;
  std::vector<ArtifactCoordinate> missing;

  [[nodiscard]] auto Complete() const -> bool {
    return missing.empty();
  }
  [[nodiscard]] auto Degraded() const -> bool {
    return !found.empty() && !missing.empty();
  }
  [[nodiscard]] auto Paths() const -> std::vector<std::filesystem::path>;
  [[nodiscard]] auto Contains(std::string_view group, std::string_view name)
      const -> bool;
};

// Resolves artifacts through an ordered list of tiers. Each (group, name)
// is resolved at most once per resolver, so every tier is consulted at most
// once per artifact per run.
class ArtifactResolver {
 public:
  ArtifactResolver(
      std::vector<std::unique_ptr<ResolutionTier>> tiers,
      std::shared_ptr<spdlog::logger> log)
      : tiers_(std::move(tiers)), log_(std::move(log)) {
  }

  auto Resolve(const ArtifactCoordinate& coordinate) -> ResolvedArtifact;

  auto ResolveAll(const std::vector<ArtifactCoordinate>& coordinates)
      -> ResolutionSet;

 private:
  std::vector<std::unique_ptr<ResolutionTier>> tiers_;
  std::shared_ptr<spdlog::logger> log_;
  std::map<std::pair<std::string, std::string>, ResolvedArtifact> cache_;
};

}  // namespace checkerlaunch::artifact
