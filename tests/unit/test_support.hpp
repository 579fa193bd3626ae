#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>

#include "checkerlaunch/version/version.hpp"

namespace checkerlaunch::test {

// Unique directory under the system temp dir, removed with its contents on
// destruction.
class TempDir {
 public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir&) = delete;
  auto operator=(const TempDir&) -> TempDir& = delete;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

  // Create a file (and its parent directories) relative to the temp dir.
  auto Write(const std::filesystem::path& relative, const std::string& content)
      -> std::filesystem::path;
  auto Touch(const std::filesystem::path& relative) -> std::filesystem::path;
  auto MakeDir(const std::filesystem::path& relative) -> std::filesystem::path;

 private:
  std::filesystem::path path_;
};

// Logger whose output lands in memory, one "[checkerlaunch] [level] msg"
// line per message.
class CapturedLog {
 public:
  CapturedLog();

  [[nodiscard]] auto Logger() const -> const std::shared_ptr<spdlog::logger>& {
    return logger_;
  }
  [[nodiscard]] auto Text() const -> std::string;
  [[nodiscard]] auto Contains(std::string_view needle) const -> bool;

 private:
  std::shared_ptr<std::ostringstream> stream_;
  std::shared_ptr<spdlog::logger> logger_;
};

// Runtime that reports a fixed version string, or nothing.
class FakeHostRuntime final : public version::HostRuntime {
 public:
  explicit FakeHostRuntime(std::optional<std::string> version)
      : version_(std::move(version)) {
  }

  [[nodiscard]] auto Version() const -> std::optional<std::string> override {
    return version_;
  }

 private:
  std::optional<std::string> version_;
};

// Write an executable shell script.
auto WriteScript(
    TempDir& dir, const std::filesystem::path& relative,
    const std::string& body) -> std::filesystem::path;

}  // namespace checkerlaunch::test
