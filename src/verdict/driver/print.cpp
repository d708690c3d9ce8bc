#include "print.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"
#include "verdict/compare/stream_compare.hpp"
#include "verdict/invoker/test_invoker.hpp"

namespace verdict::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

// Escape sequences only when a human is watching.
auto Style(fmt::text_style style) -> fmt::text_style {
  static const bool kUseColor = isatty(STDERR_FILENO) != 0;
  return kUseColor ? style : fmt::text_style{};
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kMismatch:
      return fmt::fg(fmt::terminal_color::bright_magenta) |
             fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
    default:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
}

auto DiagKindLabel(DiagKind kind) -> std::string {
  switch (kind) {
    case DiagKind::kMismatch:
      return "mismatch:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
    default:
      return "error:";
  }
}

void PrintItem(DiagKind kind, const std::string& message, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("verdict", Style(kToolStyle)),
      fmt::styled(DiagKindLabel(kind), Style(DiagKindToStyle(kind))),
      fmt::styled(
          message,
          is_primary ? Style(fmt::emphasis::bold) : fmt::text_style{}));
}

auto DiffLineStyle(std::string_view line) -> fmt::text_style {
  if (line.starts_with("+++") || line.starts_with("---")) {
    return fmt::emphasis::bold;
  }
  if (line.starts_with("@@")) {
    return fmt::fg(fmt::terminal_color::cyan);
  }
  if (line.starts_with("+")) {
    return fmt::fg(fmt::terminal_color::green);
  }
  if (line.starts_with("-")) {
    return fmt::fg(fmt::terminal_color::red);
  }
  return {};
}

}  // namespace

void PrintError(const std::string& message) {
  PrintItem(DiagKind::kHostError, message, true);
}

void PrintNote(const std::string& message) {
  PrintItem(DiagKind::kNote, message, false);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintItem(diag.primary.kind, diag.primary.message, true);
  for (const auto& note : diag.notes) {
    PrintItem(note.kind, note.message, false);
  }
}

void PrintDiff(std::string_view diff) {
  size_t pos = 0;
  while (pos < diff.size()) {
    size_t end = diff.find('\n', pos);
    if (end == std::string_view::npos) {
      end = diff.size();
    }
    std::string_view line = diff.substr(pos, end - pos);
    fmt::print(stderr, "{}\n", fmt::styled(line, Style(DiffLineStyle(line))));
    pos = end + 1;
  }
}

void PrintReport(const invoker::InvocationReport& report) {
  // Mismatches are printed below together with their diffs.
  for (const auto& diag : report.diagnostics) {
    if (diag.Kind() != DiagKind::kMismatch) {
      PrintDiagnostic(diag);
    }
  }

  for (const auto& comparison : report.comparisons) {
    if (comparison.identical) {
      continue;
    }
    PrintItem(DiagKind::kMismatch, invoker::MismatchMessage(comparison), true);
    PrintDiff(comparison.diff);
  }

  if (!report.Passed() && report.interrupt_signal == 0 &&
      report.subject_status && report.subject_status->Signaled()) {
    PrintNote(
        fmt::format(
            "subject was terminated by signal {}",
            *report.subject_status->term_signal));
  }

  if (report.cleanup_warning) {
    PrintDiagnostic(*report.cleanup_warning);
  }
}

}  // namespace verdict::driver
