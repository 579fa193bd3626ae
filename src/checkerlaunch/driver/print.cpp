#include "print.hpp"

#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

#include "checkerlaunch/common/diagnostic.hpp"

namespace checkerlaunch::driver {

namespace {

constexpr std::string_view kToolName = "checkerlaunch";
constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

struct Label {
  std::string_view text;
  fmt::terminal_color color;
};

auto LabelFor(DiagKind kind) -> Label {
  switch (kind) {
    case DiagKind::kConfigError:
    case DiagKind::kHostError:
      return {.text = "error:", .color = fmt::terminal_color::bright_red};
    case DiagKind::kCheckerFailure:
      return {
          .text = "check failed:",
          .color = fmt::terminal_color::bright_red};
    case DiagKind::kWarning:
      return {
          .text = "warning:", .color = fmt::terminal_color::bright_yellow};
    case DiagKind::kNote:
      return {.text = "note:", .color = fmt::terminal_color::bright_cyan};
  }
  return {.text = "error:", .color = fmt::terminal_color::bright_red};
}

// checkerlaunch: <label> <message>, message bold on the primary line only
void PrintLine(const DiagItem& item, bool is_primary) {
  auto label = LabelFor(item.kind);
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(kToolName, kToolStyle),
      fmt::styled(label.text, fmt::fg(label.color) | fmt::emphasis::bold),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintLine({.kind = DiagKind::kHostError, .message = message}, true);
}

void PrintWarning(const std::string& message) {
  PrintLine({.kind = DiagKind::kWarning, .message = message}, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintLine(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintLine(note, false);
  }
}

}  // namespace checkerlaunch::driver
