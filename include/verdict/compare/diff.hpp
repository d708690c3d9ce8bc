#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::compare {

// One line of a text, split on '\n'. Only the final line may lack the
// terminator; two lines are equal only if text and terminator both match.
struct Line {
  std::string_view text;
  bool has_newline = true;

  auto operator==(const Line&) const -> bool = default;
};

auto SplitLines(std::string_view content) -> std::vector<Line>;

enum class EditKind : uint8_t { kEqual, kDelete, kInsert };

// A step of the edit script turning `old` into `new`. old_index / new_index
// are positions in each sequence at this step.
struct Edit {
  EditKind kind;
  size_t old_index;
  size_t new_index;
};

// Myers shortest edit script, found by bisection in O(N + M) memory.
// Within a run of changes, deletions precede insertions. A changed region
// whose search exceeds a few thousand edit steps is reported as a plain
// replacement instead of a minimal script.
auto ComputeEdits(
    const std::vector<Line>& old_lines, const std::vector<Line>& new_lines)
    -> std::vector<Edit>;

// GNU-style unified diff of `expected` -> `actual`. Empty when identical.
auto UnifiedDiff(
    std::string_view expected, std::string_view actual,
    std::string_view expected_label, std::string_view actual_label,
    size_t context = 3) -> std::string;

// Byte offset of the first difference, nullopt when identical.
auto FirstDifferenceOffset(std::string_view lhs, std::string_view rhs)
    -> std::optional<size_t>;

}  // namespace verdict::compare
