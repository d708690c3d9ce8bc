#include "verdict/compare/stream_compare.hpp"

#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"
#include "verdict/compare/diff.hpp"

namespace verdict::compare {

namespace fs = std::filesystem;

auto StreamName(StreamKind stream) -> const char* {
  switch (stream) {
    case StreamKind::kOutput:
      return "stdout";
    case StreamKind::kError:
      return "stderr";
  }
  return "stdout";
}

auto ReadFileBytes(const fs::path& path) -> Result<std::string> {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("failed to open {} for reading", path.string())));
  }
  std::string content(
      (std::istreambuf_iterator<char>(input)),
      std::istreambuf_iterator<char>());
  if (input.bad()) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("failed to read {}", path.string())));
  }
  return content;
}

auto CompareStream(
    StreamKind stream, const fs::path& fixture_path,
    const fs::path& captured_path) -> Result<StreamComparison> {
  std::error_code ec;
  auto status = fs::status(fixture_path, ec);
  if (!fs::exists(status)) {
    return std::unexpected(
        Diagnostic::MissingFixture(
            fmt::format(
                "expected {} fixture not found: {}", StreamName(stream),
                fixture_path.string())));
  }
  if (!fs::is_regular_file(status)) {
    return std::unexpected(
        Diagnostic::MissingFixture(
            fmt::format(
                "expected {} fixture is not a regular file: {}",
                StreamName(stream), fixture_path.string())));
  }

  auto expected = ReadFileBytes(fixture_path);
  if (!expected) {
    return std::unexpected(std::move(expected.error()));
  }
  auto actual = ReadFileBytes(captured_path);
  if (!actual) {
    return std::unexpected(std::move(actual.error()));
  }

  StreamComparison result{
      .stream = stream,
      .fixture_path = fixture_path,
      .identical = *expected == *actual,
      .diff = {},
      .first_difference = std::nullopt,
  };
  if (!result.identical) {
    result.first_difference = FirstDifferenceOffset(*expected, *actual);
    result.diff = UnifiedDiff(
        *expected, *actual, fixture_path.string(),
        fmt::format("captured {}", StreamName(stream)));
  }
  return result;
}

}  // namespace verdict::compare
