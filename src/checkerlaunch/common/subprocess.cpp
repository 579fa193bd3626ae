#include "checkerlaunch/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <optional>
#include <spawn.h>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"

namespace checkerlaunch::common {

namespace {

// Splits buffered output into lines as data arrives.
class LineSplitter {
 public:
  explicit LineSplitter(const LineCallback& on_line) : on_line_(on_line) {
  }

  void Feed(std::string_view chunk) {
    if (!on_line_) {
      return;
    }
    pending_.append(chunk);
    size_t start = 0;
    size_t newline = 0;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
      Emit(std::string_view(pending_).substr(start, newline - start));
      start = newline + 1;
    }
    pending_.erase(0, start);
  }

  void Finish() {
    if (on_line_ && !pending_.empty()) {
      Emit(pending_);
      pending_.clear();
    }
  }

 private:
  void Emit(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    on_line_(line);
  }

  const LineCallback& on_line_;
  std::string pending_;
};

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir,
    const LineCallback& on_line) -> Result<SubprocessResult> {
  if (argv.empty()) {
    return std::unexpected(Diagnostic::HostError("empty argv"));
  }

  // Create pipe for stdout/stderr
  std::array<int, 2> pipe_fds{};
  if (pipe(pipe_fds.data()) != 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("pipe() failed: {}", std::strerror(errno))));
  }

  // Build argv array (must be null-terminated)
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = 0;

  if (working_dir.has_value()) {
    // Use fork+exec when working_dir is specified
    // (posix_spawn_file_actions_addchdir_np is a GNU extension).
    // The child reports chdir/exec failures as an errno on a close-on-exec
    // pipe; a successful exec closes it with nothing written.
    std::array<int, 2> err_fds{};
    if (pipe2(err_fds.data(), O_CLOEXEC) != 0) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      return std::unexpected(
          Diagnostic::HostError(
              std::format("pipe() failed: {}", std::strerror(errno))));
    }

    pid = fork();
    if (pid == -1) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      close(err_fds[0]);
      close(err_fds[1]);
      return std::unexpected(
          Diagnostic::HostError(
              std::format("fork() failed: {}", std::strerror(errno))));
    }

    if (pid == 0) {
      // Child process
      close(err_fds[0]);
      int devnull = open("/dev/null", O_RDONLY);
      if (devnull != -1) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
      }
      dup2(pipe_fds[1], STDOUT_FILENO);
      dup2(pipe_fds[1], STDERR_FILENO);
      close(pipe_fds[0]);
      close(pipe_fds[1]);

      if (chdir(working_dir->c_str()) == 0) {
        execvp(c_argv[0], c_argv.data());
      }
      int child_errno = errno;
      ssize_t ignored =
          write(err_fds[1], &child_errno, sizeof(child_errno));
      (void)ignored;
      _exit(127);
    }

    close(err_fds[1]);
    int child_errno = 0;
    ssize_t err_read = 0;
    do {
      err_read = read(err_fds[0], &child_errno, sizeof(child_errno));
    } while (err_read == -1 && errno == EINTR);
    close(err_fds[0]);

    if (err_read == static_cast<ssize_t>(sizeof(child_errno))) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      int ignored_status = 0;
      while (waitpid(pid, &ignored_status, 0) == -1 && errno == EINTR) {
      }
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "failed to start '{}' in {}: {}", argv.front(),
                  working_dir->string(), std::strerror(child_errno))));
    }
  } else {
    // Use posix_spawn when no working_dir (more efficient)
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(
        &actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
    posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);

    int spawn_result = posix_spawnp(
        &pid, c_argv[0], &actions, nullptr, c_argv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);

    if (spawn_result != 0) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "failed to start '{}': {}", argv.front(),
                  std::strerror(spawn_result))));
    }
  }

  // Close write end in parent
  close(pipe_fds[1]);

  // Drain the pipe before waiting for the child
  std::string output;
  LineSplitter splitter(on_line);
  std::array<char, 4096> buffer{};
  ssize_t bytes_read = 0;
  while (true) {
    bytes_read = read(pipe_fds[0], buffer.data(), buffer.size());
    if (bytes_read > 0) {
      std::string_view chunk(buffer.data(), static_cast<size_t>(bytes_read));
      output.append(chunk);
      splitter.Feed(chunk);
      continue;
    }
    if (bytes_read == -1 && errno == EINTR) {
      continue;
    }
    break;
  }
  splitter.Finish();
  close(pipe_fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("waitpid() failed: {}", std::strerror(errno))));
    }
  }

  int exit_code = -1;
  if (WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
  }

  return SubprocessResult{.exit_code = exit_code, .output = std::move(output)};
}

}  // namespace checkerlaunch::common
