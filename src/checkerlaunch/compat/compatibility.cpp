#include "checkerlaunch/compat/compatibility.hpp"

#include <optional>

#include "checkerlaunch/version/version.hpp"

namespace checkerlaunch::compat {

namespace {

auto IsLegacyEightOnEight(const version::VersionPair& versions) -> bool {
  return versions.runtime == 8 && versions.source == 8;
}

}  // namespace

auto NeedsModuleVisibilityFlags(const version::VersionPair& versions) -> bool {
  return versions.runtime >= kModuleSystemVersion;
}

auto NeedsAlternateFrontend(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker) -> bool {
  if (!IsLegacyEightOnEight(versions)) {
    return false;
  }
  if (!checker) {
    return true;
  }
  return checker->major >= 3 || (checker->major == 2 && checker->minor >= 11);
}

auto NeedsAnnotatedStdlib(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker) -> bool {
  if (!IsLegacyEightOnEight(versions)) {
    return false;
  }
  if (!checker) {
    return false;
  }
  return checker->major < 3 || (checker->major == 3 && checker->minor <= 3);
}

auto Decide(
    const version::VersionPair& versions,
    const std::optional<version::CheckerVersion>& checker)
    -> CompatibilityDecision {
  return CompatibilityDecision{
      .needs_alternate_frontend = NeedsAlternateFrontend(versions, checker),
      .needs_annotated_stdlib = NeedsAnnotatedStdlib(versions, checker),
      .needs_module_visibility_flags = NeedsModuleVisibilityFlags(versions),
  };
}

}  // namespace checkerlaunch::compat
