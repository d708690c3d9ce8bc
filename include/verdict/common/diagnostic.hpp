#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace verdict {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kMissingInput,      // Test case file absent
  kMissingFixture,    // Expected .out/.err file absent
  kSubprocessLaunch,  // Subject could not be started
  kMismatch,          // Captured stream differs from fixture
  kTimeout,           // Subject killed after the configured timeout
  kInterrupted,       // Harness received a termination signal
  kConfig,            // Bad CLI/config input
  kHostError,         // I/O or other environment failure
  kWarning,           // Non-fatal
  kNote,              // Auxiliary message
};

auto DiagKindName(DiagKind kind) -> const char*;

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

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

  static auto Make(DiagKind kind, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = kind, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto MissingInput(std::string msg) -> Diagnostic {
    return Make(DiagKind::kMissingInput, std::move(msg));
  }

  static auto MissingFixture(std::string msg) -> Diagnostic {
    return Make(DiagKind::kMissingFixture, std::move(msg));
  }

  static auto SubprocessLaunch(std::string msg) -> Diagnostic {
    return Make(DiagKind::kSubprocessLaunch, std::move(msg));
  }

  static auto Mismatch(std::string msg) -> Diagnostic {
    return Make(DiagKind::kMismatch, std::move(msg));
  }

  static auto Timeout(std::string msg) -> Diagnostic {
    return Make(DiagKind::kTimeout, std::move(msg));
  }

  static auto Interrupted(std::string msg) -> Diagnostic {
    return Make(DiagKind::kInterrupted, std::move(msg));
  }

  static auto Config(std::string msg) -> Diagnostic {
    return Make(DiagKind::kConfig, std::move(msg));
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, std::move(msg));
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Make(DiagKind::kWarning, std::move(msg));
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{.kind = DiagKind::kNote, .message = std::move(msg)});
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace verdict
