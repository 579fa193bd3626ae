#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "checkerlaunch/version/version.hpp"

namespace checkerlaunch::compat {

// Packages of jdk.compiler the checker runtime reaches into. Exported to
// the unnamed module on runtimes >= 9.
inline constexpr std::array<std::string_view, 9> kExportedCompilerPackages = {
    "jdk.compiler/com.sun.tools.javac.api=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.code=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.file=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.main=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.model=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.parser=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.processing=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.tree=ALL-UNNAMED",
    "jdk.compiler/com.sun.tools.javac.util=ALL-UNNAMED",
};

inline constexpr std::string_view kOpenedCompilerPackage =
    "jdk.compiler/com.sun.tools.javac.comp=ALL-UNNAMED";

inline constexpr int kModuleSystemVersion = 9;

struct CompatibilityDecision {
  bool needs_alternate_frontend;
  bool needs_annotated_stdlib;
  bool needs_module_visibility_flags;

  auto operator==(const CompatibilityDecision&) const -> bool = default;
};

// Runtime major >= 9.
auto NeedsModuleVisibilityFlags(const version::VersionPair& versions) -> bool;

// Java 8 on Java 8 with checker >= 2.11. An unparseable checker version
// counts as required.
auto NeedsAlternateFrontend(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker) -> bool;

// Java 8 on Java 8 with checker <= 3.3. An unparseable checker version
// counts as not required.
auto NeedsAnnotatedStdlib(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker) -> bool;

auto Decide(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker)
    -> CompatibilityDecision;

}  // namespace checkerlaunch::compat
