#include "checkerlaunch/artifact/artifact.hpp"

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "checkerlaunch/common/string_utils.hpp"

namespace checkerlaunch::artifact {

namespace fs = std::filesystem;

auto ArtifactCoordinate::ToString() const -> std::string {
  return std::format("{}:{}:{}", group, name, version);
}

auto RepositoryPath(const fs::path& root, const ArtifactCoordinate& coordinate)
    -> fs::path {
  fs::path path = root;
  std::string_view group = coordinate.group;
  size_t start = 0;
  while (start <= group.size()) {
    auto dot = group.find('.', start);
    auto segment = group.substr(start, dot - start);
    if (!segment.empty()) {
      path /= std::string(segment);
    }
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return path / coordinate.name / coordinate.version /
         std::format("{}-{}.jar", coordinate.name, coordinate.version);
}

auto LocationToPath(const std::string& location) -> std::optional<fs::path> {
  std::string_view view = location;
  if (view.starts_with("jar:")) {
    view.remove_prefix(4);
    if (auto bang = view.find("!/"); bang != std::string_view::npos) {
      view = view.substr(0, bang);
    }
  }
  bool is_url = view.starts_with("file:");
  if (is_url) {
    view.remove_prefix(5);
  }
  // An authority, if present, must name this host: "file:///x" and
  // "file://localhost/x" are both "/x".
  if (is_url && view.starts_with("//")) {
    view.remove_prefix(2);
    auto slash = view.find('/');
    auto authority = view.substr(0, slash);
    if (!authority.empty() && authority != "localhost") {
      return std::nullopt;
    }
    view = slash == std::string_view::npos ? std::string_view{}
                                           : view.substr(slash);
  }
  if (view.empty()) {
    return std::nullopt;
  }
  return fs::path(common::UrlDecode(view));
}

}  // namespace checkerlaunch::artifact
