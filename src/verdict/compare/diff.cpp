#include "verdict/compare/diff.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace verdict::compare {

namespace {

constexpr std::string_view kNoNewlineMarker = "\\ No newline at end of file\n";

struct Hunk {
  size_t begin;  // index into edits
  size_t end;    // one past last edit
};

// "-l,s" / "+l,s" range as printed by GNU diff.
auto FormatRange(size_t start, size_t count) -> std::string {
  if (count == 0) {
    return fmt::format("{},0", start);
  }
  if (count == 1) {
    return fmt::format("{}", start + 1);
  }
  return fmt::format("{},{}", start + 1, count);
}

void AppendLine(std::string& out, char prefix, const Line& line) {
  out += prefix;
  out += line.text;
  out += '\n';
  if (!line.has_newline) {
    out += kNoNewlineMarker;
  }
}

auto GroupHunks(const std::vector<Edit>& edits, size_t context)
    -> std::vector<Hunk> {
  std::vector<Hunk> hunks;
  std::optional<size_t> last_change;

  for (size_t i = 0; i < edits.size(); ++i) {
    if (edits[i].kind == EditKind::kEqual) {
      continue;
    }
    // Merge when the run of equal lines in between fits in both contexts.
    if (last_change && i - *last_change - 1 <= 2 * context) {
      hunks.back().end = i + 1;
    } else {
      size_t begin = i > context ? i - context : 0;
      hunks.push_back(Hunk{.begin = begin, .end = i + 1});
    }
    last_change = i;
  }

  for (auto& hunk : hunks) {
    hunk.end = std::min(edits.size(), hunk.end + context);
  }
  return hunks;
}

// Half-open line ranges still to be diffed.
struct Range {
  size_t old_begin;
  size_t old_end;
  size_t new_begin;
  size_t new_end;
};

// Give up searching for a minimal split after this many edit steps and
// report the remaining range as a plain replacement. Keeps time bounded
// when two large texts have almost nothing in common.
constexpr ptrdiff_t kMaxBisectSteps = 4096;

// Myers' middle snake: run the forward and reverse searches until their
// paths overlap and return the overlap point relative to the range start.
// nullopt when the step limit is hit first.
auto Bisect(
    const std::vector<Line>& old_lines, const std::vector<Line>& new_lines,
    const Range& range) -> std::optional<std::pair<size_t, size_t>> {
  const auto n = static_cast<ptrdiff_t>(range.old_end - range.old_begin);
  const auto m = static_cast<ptrdiff_t>(range.new_end - range.new_begin);
  const ptrdiff_t max_d = (n + m + 1) / 2;
  const ptrdiff_t offset = max_d;
  const ptrdiff_t length = (2 * max_d) + 2;

  // Only two rows of furthest-reaching x per direction: O(N + M) memory.
  std::vector<ptrdiff_t> forward(static_cast<size_t>(length), -1);
  std::vector<ptrdiff_t> reverse(static_cast<size_t>(length), -1);
  auto at = [](std::vector<ptrdiff_t>& v, ptrdiff_t i) -> ptrdiff_t& {
    return v[static_cast<size_t>(i)];
  };
  auto old_at = [&](ptrdiff_t i) -> const Line& {
    return old_lines[range.old_begin + static_cast<size_t>(i)];
  };
  auto new_at = [&](ptrdiff_t i) -> const Line& {
    return new_lines[range.new_begin + static_cast<size_t>(i)];
  };
  auto split = [](ptrdiff_t x, ptrdiff_t y) {
    return std::make_pair(static_cast<size_t>(x), static_cast<size_t>(y));
  };

  at(forward, offset + 1) = 0;
  at(reverse, offset + 1) = 0;
  const ptrdiff_t delta = n - m;
  // With odd delta the forward search detects the overlap, else the reverse.
  const bool front = delta % 2 != 0;

  ptrdiff_t k1_start = 0;
  ptrdiff_t k1_end = 0;
  ptrdiff_t k2_start = 0;
  ptrdiff_t k2_end = 0;
  const ptrdiff_t limit = std::min(max_d, kMaxBisectSteps);

  for (ptrdiff_t d = 0; d < limit; ++d) {
    for (ptrdiff_t k1 = -d + k1_start; k1 <= d - k1_end; k1 += 2) {
      ptrdiff_t k1_offset = offset + k1;
      ptrdiff_t x1 = 0;
      if (k1 == -d || (k1 != d && at(forward, k1_offset - 1) <
                                      at(forward, k1_offset + 1))) {
        x1 = at(forward, k1_offset + 1);
      } else {
        x1 = at(forward, k1_offset - 1) + 1;
      }
      ptrdiff_t y1 = x1 - k1;
      while (x1 < n && y1 < m && old_at(x1) == new_at(y1)) {
        ++x1;
        ++y1;
      }
      at(forward, k1_offset) = x1;
      if (x1 > n) {
        k1_end += 2;
      } else if (y1 > m) {
        k1_start += 2;
      } else if (front) {
        ptrdiff_t k2_offset = offset + delta - k1;
        if (k2_offset >= 0 && k2_offset < length &&
            at(reverse, k2_offset) != -1) {
          ptrdiff_t x2 = n - at(reverse, k2_offset);
          if (x1 >= x2) {
            return split(x1, y1);
          }
        }
      }
    }

    for (ptrdiff_t k2 = -d + k2_start; k2 <= d - k2_end; k2 += 2) {
      ptrdiff_t k2_offset = offset + k2;
      ptrdiff_t x2 = 0;
      if (k2 == -d || (k2 != d && at(reverse, k2_offset - 1) <
                                      at(reverse, k2_offset + 1))) {
        x2 = at(reverse, k2_offset + 1);
      } else {
        x2 = at(reverse, k2_offset - 1) + 1;
      }
      ptrdiff_t y2 = x2 - k2;
      while (x2 < n && y2 < m &&
             old_at(n - x2 - 1) == new_at(m - y2 - 1)) {
        ++x2;
        ++y2;
      }
      at(reverse, k2_offset) = x2;
      if (x2 > n) {
        k2_end += 2;
      } else if (y2 > m) {
        k2_start += 2;
      } else if (!front) {
        ptrdiff_t k1_offset = offset + delta - k2;
        if (k1_offset >= 0 && k1_offset < length &&
            at(forward, k1_offset) != -1) {
          ptrdiff_t x1 = at(forward, k1_offset);
          ptrdiff_t y1 = offset + x1 - k1_offset;
          if (x1 >= n - x2) {
            return split(x1, y1);
          }
        }
      }
    }
  }
  return std::nullopt;
}

void DiffRange(
    const std::vector<Line>& old_lines, const std::vector<Line>& new_lines,
    Range range, std::vector<EditKind>& script) {
  size_t prefix = 0;
  while (range.old_begin + prefix < range.old_end &&
         range.new_begin + prefix < range.new_end &&
         old_lines[range.old_begin + prefix] ==
             new_lines[range.new_begin + prefix]) {
    ++prefix;
  }
  script.insert(script.end(), prefix, EditKind::kEqual);
  range.old_begin += prefix;
  range.new_begin += prefix;

  size_t suffix = 0;
  while (range.old_end - suffix > range.old_begin &&
         range.new_end - suffix > range.new_begin &&
         old_lines[range.old_end - suffix - 1] ==
             new_lines[range.new_end - suffix - 1]) {
    ++suffix;
  }
  range.old_end -= suffix;
  range.new_end -= suffix;

  const size_t old_count = range.old_end - range.old_begin;
  const size_t new_count = range.new_end - range.new_begin;
  std::optional<std::pair<size_t, size_t>> middle;
  if (old_count != 0 && new_count != 0) {
    middle = Bisect(old_lines, new_lines, range);
  }

  if (middle) {
    auto [x, y] = *middle;
    DiffRange(
        old_lines, new_lines,
        Range{
            .old_begin = range.old_begin,
            .old_end = range.old_begin + x,
            .new_begin = range.new_begin,
            .new_end = range.new_begin + y},
        script);
    DiffRange(
        old_lines, new_lines,
        Range{
            .old_begin = range.old_begin + x,
            .old_end = range.old_end,
            .new_begin = range.new_begin + y,
            .new_end = range.new_end},
        script);
  } else {
    script.insert(script.end(), old_count, EditKind::kDelete);
    script.insert(script.end(), new_count, EditKind::kInsert);
  }

  script.insert(script.end(), suffix, EditKind::kEqual);
}

}  // namespace

auto SplitLines(std::string_view content) -> std::vector<Line> {
  std::vector<Line> lines;
  size_t pos = 0;
  while (pos < content.size()) {
    size_t newline = content.find('\n', pos);
    if (newline == std::string_view::npos) {
      lines.push_back(Line{.text = content.substr(pos), .has_newline = false});
      break;
    }
    lines.push_back(
        Line{.text = content.substr(pos, newline - pos), .has_newline = true});
    pos = newline + 1;
  }
  return lines;
}

auto ComputeEdits(
    const std::vector<Line>& old_lines, const std::vector<Line>& new_lines)
    -> std::vector<Edit> {
  std::vector<EditKind> script;
  script.reserve(std::max(old_lines.size(), new_lines.size()));
  DiffRange(
      old_lines, new_lines,
      Range{
          .old_begin = 0,
          .old_end = old_lines.size(),
          .new_begin = 0,
          .new_end = new_lines.size()},
      script);

  // Bisection can interleave deletions and insertions inside one changed
  // region; list each region's deletions first, as diff(1) does.
  for (auto it = script.begin(); it != script.end();) {
    if (*it == EditKind::kEqual) {
      ++it;
      continue;
    }
    auto run_end = std::find(it, script.end(), EditKind::kEqual);
    std::stable_partition(
        it, run_end, [](EditKind kind) { return kind == EditKind::kDelete; });
    it = run_end;
  }

  // Number the steps by the position reached in each sequence.
  std::vector<Edit> edits;
  edits.reserve(script.size());
  size_t x = 0;
  size_t y = 0;
  for (EditKind kind : script) {
    edits.push_back(Edit{.kind = kind, .old_index = x, .new_index = y});
    if (kind != EditKind::kInsert) {
      ++x;
    }
    if (kind != EditKind::kDelete) {
      ++y;
    }
  }
  return edits;
}

auto UnifiedDiff(
    std::string_view expected, std::string_view actual,
    std::string_view expected_label, std::string_view actual_label,
    size_t context) -> std::string {
  if (expected == actual) {
    return {};
  }

  auto old_lines = SplitLines(expected);
  auto new_lines = SplitLines(actual);
  auto edits = ComputeEdits(old_lines, new_lines);

  std::string out =
      fmt::format("--- {}\n+++ {}\n", expected_label, actual_label);

  for (const auto& hunk : GroupHunks(edits, context)) {
    size_t old_count = 0;
    size_t new_count = 0;
    for (size_t i = hunk.begin; i < hunk.end; ++i) {
      if (edits[i].kind != EditKind::kInsert) {
        ++old_count;
      }
      if (edits[i].kind != EditKind::kDelete) {
        ++new_count;
      }
    }

    out += fmt::format(
        "@@ -{} +{} @@\n",
        FormatRange(edits[hunk.begin].old_index, old_count),
        FormatRange(edits[hunk.begin].new_index, new_count));

    for (size_t i = hunk.begin; i < hunk.end; ++i) {
      const Edit& edit = edits[i];
      switch (edit.kind) {
        case EditKind::kEqual:
          AppendLine(out, ' ', old_lines[edit.old_index]);
          break;
        case EditKind::kDelete:
          AppendLine(out, '-', old_lines[edit.old_index]);
          break;
        case EditKind::kInsert:
          AppendLine(out, '+', new_lines[edit.new_index]);
          break;
      }
    }
  }
  return out;
}

auto FirstDifferenceOffset(std::string_view lhs, std::string_view rhs)
    -> std::optional<size_t> {
  auto [lhs_it, rhs_it] =
      std::mismatch(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  if (lhs_it == lhs.end() && rhs_it == rhs.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(lhs_it - lhs.begin());
}

}  // namespace verdict::compare
