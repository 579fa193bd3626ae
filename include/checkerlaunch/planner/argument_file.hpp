#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"

namespace checkerlaunch::planner {

// A temporary compiler argument file, passed to javac as "@<path>".
// The file is removed when the owning object is destroyed, on every exit
// path of a run.
class ArgumentFile {
 public:
  // Write `lines` (one per line) to a new file in the temp directory.
  static auto Create(
      std::string_view prefix, std::string_view suffix,
      const std::vector<std::string>& lines) -> Result<ArgumentFile>;

  ~ArgumentFile();

  ArgumentFile(const ArgumentFile&) = delete;
  auto operator=(const ArgumentFile&) -> ArgumentFile& = delete;
  ArgumentFile(ArgumentFile&& other) noexcept;
  auto operator=(ArgumentFile&& other) noexcept -> ArgumentFile&;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

  // "@<absolute path>"
  [[nodiscard]] auto Reference() const -> std::string;

 private:
  explicit ArgumentFile(std::filesystem::path path) : path_(std::move(path)) {
  }

  void Remove() noexcept;

  std::filesystem::path path_;
};

// Contents of a classpath argument file: a single "-cp <classpath>" line,
// quoted when the classpath contains whitespace.
auto ClasspathFileLines(const std::vector<std::string>& classpath)
    -> std::vector<std::string>;

// Contents of a source list argument file: one absolute path per line.
auto SourceFileLines(const std::vector<std::filesystem::path>& sources)
    -> std::vector<std::string>;

}  // namespace checkerlaunch::planner
