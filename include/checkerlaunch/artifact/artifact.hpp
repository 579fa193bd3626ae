#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace checkerlaunch::artifact {

inline constexpr auto kCheckerGroup = "org.checkerframework";
inline constexpr auto kCheckerName = "checker";
inline constexpr auto kCheckerQualName = "checker-qual";
inline constexpr auto kAnnotatedJdkName = "jdk8";
inline constexpr auto kDefaultCheckerVersion = "3.53.0";

inline constexpr auto kAlternateFrontendGroup = "com.google.errorprone";
inline constexpr auto kAlternateFrontendName = "javac";
inline constexpr auto kAlternateFrontendVersion = "9+181-r4173-1";

struct ArtifactCoordinate {
  std::string group;
  std::string name;
  std::string version;

  auto operator==(const ArtifactCoordinate&) const -> bool = default;

  // "group:name:version"
  [[nodiscard]] auto ToString() const -> std::string;
};

// Outcome of resolving one coordinate. Immutable once produced.
struct ResolvedArtifact {
  std::string group;
  std::string name;
  std::string version;
  std::optional<std::filesystem::path> file;

  [[nodiscard]] auto Found() const -> bool {
    return file.has_value();
  }
};

// Conventional location of a jar inside a maven-layout repository:
// <root>/<group with '/' for '.'>/<name>/<version>/<name>-<version>.jar
auto RepositoryPath(
    const std::filesystem::path& root, const ArtifactCoordinate& coordinate)
    -> std::filesystem::path;

// Turn a code-source location into a filesystem path. Accepts plain paths,
// "file:" URLs and "jar:file:...!/entry" URLs; %XX escapes are decoded.
auto LocationToPath(const std::string& location)
    -> std::optional<std::filesystem::path>;

}  // namespace checkerlaunch::artifact
