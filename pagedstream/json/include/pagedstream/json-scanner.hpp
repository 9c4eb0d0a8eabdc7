#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pagedstream {

// Maximum nesting depth of a single JSON value accepted by ScanValue.
inline constexpr std::size_t kMaxJsonNestingDepth = 512;

struct ScanResult {
  enum class Status : std::uint8_t {
    // The value spans [pos, end).
    Complete,
    // The buffer ends before the value does.
    Incomplete,
    // Not a JSON value (or unbalanced brackets).
    Malformed,
    // Nesting deeper than kMaxJsonNestingDepth.
    TooDeep,
  };

  Status status;
  std::size_t end;
};

// Finds the end of the JSON value starting at 'buf[pos]' (which should not be a whitespace).
// Strings are fully scanned with their escape sequences, objects and arrays are bracket balanced,
// their content is not validated further. Literals and numbers ending exactly at the end of the buffer
// are only complete if 'isFinalBlock' is true.
[[nodiscard]] ScanResult ScanValue(std::string_view buf, std::size_t pos, bool isFinalBlock);

[[nodiscard]] constexpr bool IsJsonWhitespace(char ch) noexcept {
  return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t';
}

// Position of the first non whitespace char at or after 'pos', buf.size() if none.
[[nodiscard]] constexpr std::size_t SkipJsonWhitespace(std::string_view buf, std::size_t pos) noexcept {
  while (pos < buf.size() && IsJsonWhitespace(buf[pos])) {
    ++pos;
  }
  return pos;
}

}  // namespace pagedstream
