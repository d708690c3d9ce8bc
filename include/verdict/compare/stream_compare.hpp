#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "verdict/common/diagnostic.hpp"

namespace verdict::compare {

enum class StreamKind : uint8_t { kOutput, kError };

// "stdout" / "stderr"
auto StreamName(StreamKind stream) -> const char*;

struct StreamComparison {
  StreamKind stream;
  std::filesystem::path fixture_path;
  bool identical = false;
  // Unified diff fixture -> captured, empty when identical.
  std::string diff;
  std::optional<size_t> first_difference;
};

// Read a whole file in binary mode.
auto ReadFileBytes(const std::filesystem::path& path) -> Result<std::string>;

// Byte-exact comparison of a captured stream against its fixture.
// An absent fixture is kMissingFixture; an empty one is a valid expectation.
auto CompareStream(
    StreamKind stream, const std::filesystem::path& fixture_path,
    const std::filesystem::path& captured_path) -> Result<StreamComparison>;

}  // namespace verdict::compare
