#include "checkerlaunch/planner/argument_file.hpp"

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/common/string_utils.hpp"

namespace checkerlaunch::planner {

namespace fs = std::filesystem;

namespace {

constexpr char kPathSeparator = ':';

}  // namespace

auto ArgumentFile::Create(
    std::string_view prefix, std::string_view suffix,
    const std::vector<std::string>& lines) -> Result<ArgumentFile> {
  std::error_code ec;
  fs::path tmp_dir = fs::temp_directory_path(ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("no temporary directory: {}", ec.message())));
  }

  std::string tmpl =
      (tmp_dir / std::format("{}_XXXXXX{}", prefix, suffix)).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to create temp file {}: {}", tmpl,
                std::strerror(errno))));
  }
  close(fd);

  // Owned from here on, so a failed write still removes the file.
  ArgumentFile file{fs::path(buf.data())};

  std::ofstream out(file.path_, std::ios::trunc);
  for (const auto& line : lines) {
    out << line << '\n';
  }
  out.flush();
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("failed to write {}", file.path_.string())));
  }
  return file;
}

ArgumentFile::~ArgumentFile() {
  Remove();
}

ArgumentFile::ArgumentFile(ArgumentFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {
}

auto ArgumentFile::operator=(ArgumentFile&& other) noexcept -> ArgumentFile& {
  if (this != &other) {
    Remove();
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

void ArgumentFile::Remove() noexcept {
  if (!path_.empty()) {
    std::error_code ec;
    fs::remove(path_, ec);
    path_.clear();
  }
}

auto ArgumentFile::Reference() const -> std::string {
  return "@" + fs::absolute(path_).string();
}

auto ClasspathFileLines(const std::vector<std::string>& classpath)
    -> std::vector<std::string> {
  std::string joined = common::Join(classpath, std::string(1, kPathSeparator));
  return {"-cp " + common::QuoteArgFileToken(joined)};
}

auto SourceFileLines(const std::vector<fs::path>& sources)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  lines.reserve(sources.size());
  for (const auto& source : sources) {
    lines.push_back(common::QuoteArgFileToken(fs::absolute(source).string()));
  }
  return lines;
}

}  // namespace checkerlaunch::planner
