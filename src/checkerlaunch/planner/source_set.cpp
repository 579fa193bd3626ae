#include "checkerlaunch/planner/source_set.hpp"

#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/logger.h>

#include "checkerlaunch/config/build_context.hpp"
#include "checkerlaunch/config/project_config.hpp"
#include "checkerlaunch/lombok/lombok.hpp"

namespace checkerlaunch::planner {

namespace fs = std::filesystem;

namespace {

auto SplitSegments(std::string_view path) -> std::vector<std::string> {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    auto slash = path.find('/', start);
    auto segment = path.substr(start, slash - start);
    if (!segment.empty()) {
      segments.emplace_back(segment);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return segments;
}

auto MatchSegments(
    const std::vector<std::string>& pattern, size_t pi,
    const std::vector<std::string>& path, size_t si) -> bool {
  if (pi == pattern.size()) {
    return si == path.size();
  }
  if (pattern[pi] == "**") {
    // Zero or more directories
    for (size_t skip = si; skip <= path.size(); ++skip) {
      if (MatchSegments(pattern, pi + 1, path, skip)) {
        return true;
      }
    }
    return false;
  }
  if (si == path.size()) {
    return false;
  }
  if (fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
    return false;
  }
  return MatchSegments(pattern, pi + 1, path, si + 1);
}

auto MatchesAny(
    const std::vector<std::string>& patterns, std::string_view relative)
    -> bool {
  return std::ranges::any_of(patterns, [&](const std::string& pattern) {
    return MatchesPattern(pattern, relative);
  });
}

// A directory symlink whose target contains the link itself; following it
// would recurse forever.
auto LeadsToAncestor(const fs::path& link) -> bool {
  std::error_code ec;
  auto target = fs::canonical(link, ec);
  if (ec) {
    return false;
  }
  auto parent = fs::canonical(link.parent_path(), ec);
  if (ec) {
    return false;
  }
  auto [target_pos, parent_pos] =
      std::mismatch(target.begin(), target.end(), parent.begin(), parent.end());
  return target_pos == target.end();
}

void AddUnique(std::vector<fs::path>& roots, fs::path root) {
  if (std::ranges::find(roots, root) == roots.end()) {
    roots.push_back(std::move(root));
  }
}

}  // namespace

auto SelectSourceRoots(
    const config::BuildContext& build, const lombok::LombokState& lombok,
    bool exclude_tests) -> std::vector<fs::path> {
  std::vector<fs::path> roots;

  bool has_main = false;
  bool has_test = false;
  for (const auto& root : build.source_roots) {
    if (!root.enabled) {
      continue;
    }
    if (root.scope == config::SourceScope::kMain) {
      has_main = true;
      if (!lombok.delombok_dir) {
        AddUnique(roots, root.path);
      }
    } else if (!exclude_tests) {
      has_test = true;
      if (!lombok.test_delombok_dir) {
        AddUnique(roots, root.path);
      }
    }
  }

  if (has_main && lombok.delombok_dir) {
    AddUnique(roots, *lombok.delombok_dir);
  }
  if (has_test && lombok.test_delombok_dir) {
    AddUnique(roots, *lombok.test_delombok_dir);
  }
  return roots;
}

auto MatchesPattern(std::string_view pattern, std::string_view relative_path)
    -> bool {
  return MatchSegments(
      SplitSegments(pattern), 0, SplitSegments(relative_path), 0);
}

auto ScanSources(
    const std::vector<fs::path>& roots,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes, spdlog::logger& log)
    -> std::vector<fs::path> {
  std::vector<std::string> effective_includes = includes;
  if (effective_includes.empty()) {
    effective_includes.emplace_back(config::kDefaultInclude);
  }
  std::vector<std::string> effective_excludes = excludes;
  effective_excludes.insert(
      effective_excludes.end(), kDefaultExcludes.begin(),
      kDefaultExcludes.end());

  std::vector<fs::path> sources;
  for (const auto& root : roots) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }

    std::vector<fs::path> found;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::follow_directory_symlink |
                  fs::directory_options::skip_permission_denied,
        ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code entry_ec;
      if (it->is_symlink(entry_ec) && it->is_directory(entry_ec) &&
          LeadsToAncestor(it->path())) {
        log.warn(
            "not following {}: it links back to an enclosing directory",
            it->path().string());
        it.disable_recursion_pending();
        continue;
      }
      if (!it->is_regular_file(entry_ec)) {
        continue;
      }
      std::string relative =
          it->path().lexically_relative(root).generic_string();
      if (MatchesAny(effective_includes, relative) &&
          !MatchesAny(effective_excludes, relative)) {
        found.push_back(fs::absolute(it->path()));
      }
    }
    if (ec) {
      log.warn(
          "scanning {} stopped early: {}; the source list may be incomplete",
          root.string(), ec.message());
    }
    std::ranges::sort(found);
    sources.insert(sources.end(), found.begin(), found.end());
  }
  return sources;
}

}  // namespace checkerlaunch::planner
