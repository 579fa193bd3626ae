#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::version {

// Sentinel for a version that could not be read or parsed.
inline constexpr int kUnknownVersion = -1;
inline constexpr int kMinimumJavaVersion = 8;

inline constexpr auto kSourceProperty = "maven.compiler.source";
inline constexpr auto kTargetProperty = "maven.compiler.target";

// Normalize a Java version string to its major number.
//   "1.8", "8"           -> 8
//   "17.0.1", "11-ea"    -> 17, 11
//   "9+10", "1.8.0_292"  -> 9, 8
// Returns kUnknownVersion for empty or unparseable input.
auto ParseJavaMajorVersion(std::string_view raw) -> int;

struct CheckerVersion {
  int major;
  int minor;

  auto operator==(const CheckerVersion&) const -> bool = default;
};

// Parse "X.Y[.anything]" into (X, Y). Single-component or non-numeric
// strings yield nullopt.
auto ParseCheckerVersion(std::string_view raw) -> std::optional<CheckerVersion>;

// Source and runtime major versions of one run. Resolved once, before any
// compatibility decision.
struct VersionPair {
  int source;
  int runtime;

  auto operator==(const VersionPair&) const -> bool = default;
};

// The Java runtime that will execute the compiler when no toolchain
// advertises a version.
class HostRuntime {
 public:
  virtual ~HostRuntime() = default;

  // Raw version string, or nullopt when it cannot be determined.
  [[nodiscard]] virtual auto Version() const -> std::optional<std::string> = 0;
};

// Probes `<executable> -version`.
class ExecutableHostRuntime final : public HostRuntime {
 public:
  explicit ExecutableHostRuntime(std::string executable)
      : executable_(std::move(executable)) {
  }

  [[nodiscard]] auto Version() const -> std::optional<std::string> override;

 private:
  std::string executable_;
};

// Extract the version token from `javac -version` or `java -version` output.
auto ParseVersionOutput(std::string_view output) -> std::optional<std::string>;

// Major source version from the compiler source property, falling back to
// the compiler target property. kUnknownVersion if neither parses.
auto DetectSourceVersion(const config::BuildContext& build) -> int;

// Major runtime version from the toolchain's advertised version, falling
// back to the host runtime. kUnknownVersion if neither parses.
auto DetectRuntimeVersion(
    const config::BuildContext& build, const HostRuntime& host) -> int;

// Resolve both versions. Fails if either is unknown or below
// kMinimumJavaVersion.
auto DetectVersions(const config::BuildContext& build, const HostRuntime& host)
    -> Result<VersionPair>;

}  // namespace checkerlaunch::version
