#include "verdict/common/diagnostic.hpp"

namespace verdict {

auto DiagKindName(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kMissingInput:
      return "missing input";
    case DiagKind::kMissingFixture:
      return "missing fixture";
    case DiagKind::kSubprocessLaunch:
      return "launch failure";
    case DiagKind::kMismatch:
      return "mismatch";
    case DiagKind::kTimeout:
      return "timeout";
    case DiagKind::kInterrupted:
      return "interrupted";
    case DiagKind::kConfig:
      return "config error";
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

}  // namespace verdict
