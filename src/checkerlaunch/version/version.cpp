#include "checkerlaunch/version/version.hpp"

#include <algorithm>
#include <charconv>
#include <expected>
#include <format>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/common/subprocess.hpp"
#include "checkerlaunch/config/build_context.hpp"

namespace checkerlaunch::version {

namespace {

// Parse the whole of `s` as a non-negative integer.
auto ParseWholeInt(std::string_view s) -> std::optional<int> {
  if (s.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

// Leading integer of `s`, terminated by the first version delimiter.
auto LeadingComponent(std::string_view s) -> std::optional<int> {
  auto cut = s.find_first_of(".-+_");
  return ParseWholeInt(s.substr(0, cut));
}

}  // namespace

auto ParseJavaMajorVersion(std::string_view raw) -> int {
  std::string_view trimmed = common::Trim(raw);
  if (trimmed.empty()) {
    return kUnknownVersion;
  }

  // Bare legacy form: "8" means "1.8"
  std::string normalized(trimmed);
  if (auto bare = ParseWholeInt(trimmed);
      bare && *bare <= kMinimumJavaVersion) {
    normalized = std::format("1.{}", *bare);
  }

  std::string_view view = normalized;
  if (view.starts_with("1.")) {
    view.remove_prefix(2);
  }
  return LeadingComponent(view).value_or(kUnknownVersion);
}

auto ParseCheckerVersion(std::string_view raw)
    -> std::optional<CheckerVersion> {
  std::string_view trimmed = common::Trim(raw);
  auto first_dot = trimmed.find('.');
  if (first_dot == std::string_view::npos) {
    return std::nullopt;
  }
  auto rest = trimmed.substr(first_dot + 1);
  auto second_dot = rest.find('.');

  auto major = ParseWholeInt(trimmed.substr(0, first_dot));
  auto minor = ParseWholeInt(rest.substr(0, second_dot));
  if (!major || !minor) {
    return std::nullopt;
  }
  return CheckerVersion{.major = *major, .minor = *minor};
}

auto ParseVersionOutput(std::string_view output) -> std::optional<std::string> {
  // Parse: "javac 17.0.1", "javac 1.8.0_292",
  //        "openjdk version \"11.0.2\" 2019-01-15"
  static const std::regex kVersionRegex(
      R"((?:javac|version)\s+"?(\d[^"\s]*)"?)");
  std::string text(output);
  std::smatch match;
  if (!std::regex_search(text, match, kVersionRegex)) {
    return std::nullopt;
  }
  return match[1].str();
}

auto ExecutableHostRuntime::Version() const -> std::optional<std::string> {
  auto result = common::RunSubprocess({executable_, "-version"});
  if (!result || result->exit_code != 0) {
    return std::nullopt;
  }
  return ParseVersionOutput(result->output);
}

auto DetectSourceVersion(const config::BuildContext& build) -> int {
  // An unparseable value (e.g. an unresolved ${...} expression) falls
  // through to the next property.
  for (const auto* key : {kSourceProperty, kTargetProperty}) {
    if (auto raw = build.Property(key)) {
      if (int major = ParseJavaMajorVersion(*raw); major != kUnknownVersion) {
        return major;
      }
    }
  }
  return kUnknownVersion;
}

auto DetectRuntimeVersion(
    const config::BuildContext& build, const HostRuntime& host) -> int {
  if (build.toolchain) {
    if (auto raw = build.toolchain->Version()) {
      if (int major = ParseJavaMajorVersion(*raw); major != kUnknownVersion) {
        return major;
      }
    }
  }
  if (auto raw = host.Version()) {
    return ParseJavaMajorVersion(*raw);
  }
  return kUnknownVersion;
}

auto DetectVersions(const config::BuildContext& build, const HostRuntime& host)
    -> Result<VersionPair> {
  int source = DetectSourceVersion(build);
  if (source == kUnknownVersion) {
    return std::unexpected(
        Diagnostic::ConfigError("cannot determine the Java source version")
            .WithNote(
                std::format(
                    "set '{}' or '{}' in [properties]", kSourceProperty,
                    kTargetProperty)));
  }

  int runtime = DetectRuntimeVersion(build, host);
  if (runtime == kUnknownVersion) {
    return std::unexpected(
        Diagnostic::ConfigError("cannot determine the Java runtime version")
            .WithNote(
                "configure [toolchain] with a 'version', or make sure the "
                "executable answers '-version'"));
  }

  if (source < kMinimumJavaVersion || runtime < kMinimumJavaVersion) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "Java {} or later is required (source {}, runtime {})",
                kMinimumJavaVersion, source, runtime)));
  }

  return VersionPair{.source = source, .runtime = runtime};
}

}  // namespace checkerlaunch::version
