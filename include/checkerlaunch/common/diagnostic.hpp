#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace checkerlaunch {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kConfigError,     // Missing or contradictory project configuration
  kHostError,       // I/O, process spawn, malformed external input
  kCheckerFailure,  // The checker ran and reported errors
  kWarning,         // Non-fatal
  kNote,            // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: the project description cannot support a run
  static auto ConfigError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kConfigError, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error (filesystem, subprocess)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: checker exited with a non-zero status
  static auto CheckerFailure(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kCheckerFailure, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace checkerlaunch
