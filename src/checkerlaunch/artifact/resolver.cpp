#include "checkerlaunch/artifact/resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/artifact/artifact.hpp"

namespace checkerlaunch::artifact {

auto ResolutionSet::Paths() const -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> paths;
  paths.reserve(found.size());
  for (const auto& artifact : found) {
    paths.push_back(*artifact.file);
  }
  return paths;
}

auto ResolutionSet::Contains(std::string_view group, std::string_view name)
    const -> bool {
  return std::ranges::any_of(found, [&](const ResolvedArtifact& artifact) {
    return artifact.group == group && artifact.name == name;
  });
}

auto ArtifactResolver::Resolve(const ArtifactCoordinate& coordinate)
    -> ResolvedArtifact {
  auto key = std::make_pair(coordinate.group, coordinate.name);
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }

  ResolvedArtifact resolved{
      .group = coordinate.group,
      .name = coordinate.name,
      .version = coordinate.version,
      .file = std::nullopt,
  };

  for (const auto& tier : tiers_) {
    auto result = tier->Lookup(coordinate);
    if (!result) {
      log_->warn(
          "{}: {} lookup failed: {}", coordinate.ToString(), tier->Name(),
          result.error());
      continue;
    }
    if (!result->has_value()) {
      log_->warn(
          "{}: not found in {}; trying the next tier", coordinate.ToString(),
          tier->Name());
      continue;
    }
    resolved = std::move(**result);
    log_->debug(
        "{}: resolved from {}: {}", coordinate.ToString(), tier->Name(),
        resolved.file->string());
    break;
  }

  if (!resolved.Found()) {
    log_->warn("could not resolve {}", coordinate.ToString());
  }

  cache_.emplace(std::move(key), resolved);
  return resolved;
}

auto ArtifactResolver::ResolveAll(
    const std::vector<ArtifactCoordinate>& coordinates) -> ResolutionSet {
  ResolutionSet set;
  for (const auto& coordinate : coordinates) {
    auto resolved = Resolve(coordinate);
    if (resolved.Found()) {
      set.found.push_back(std::move(resolved));
    } else {
      set.missing.push_back(coordinate);
    }
  }
  return set;
}

}  // namespace checkerlaunch::artifact
