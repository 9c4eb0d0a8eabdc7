#include "pagedstream/json-scanner.hpp"

#include <cstddef>
#include <string_view>

#include "pagedstream/vector.hpp"

namespace pagedstream {

namespace {

using Status = ScanResult::Status;

// Scans the string whose opening quote is at 'pos'.
ScanResult ScanString(std::string_view buf, std::size_t pos) {
  for (std::size_t idx = pos + 1U; idx < buf.size(); ++idx) {
    const char ch = buf[idx];
    if (ch == '"') {
      return {Status::Complete, idx + 1U};
    }
    if (ch == '\\') {
      // the escaped char is skipped, \u sequences are validated by the value conversion
      ++idx;
    } else if (static_cast<unsigned char>(ch) < 0x20U) {
      return {Status::Malformed, idx};
    }
  }
  return {Status::Incomplete, buf.size()};
}

constexpr bool IsScalarChar(char ch) noexcept {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '-' ||
         ch == '+' || ch == '.';
}

ScanResult ScanScalar(std::string_view buf, std::size_t pos, bool isFinalBlock) {
  std::size_t end = pos;
  while (end < buf.size() && IsScalarChar(buf[end])) {
    ++end;
  }
  if (end == buf.size() && !isFinalBlock) {
    // '12' could be the beginning of '123', 'tr' of 'true'
    return {Status::Incomplete, end};
  }
  const std::string_view token = buf.substr(pos, end - pos);
  const char first = token.front();
  if (first == '-' || (first >= '0' && first <= '9')) {
    for (char ch : token) {
      if (!((ch >= '0' && ch <= '9') || ch == '-' || ch == '+' || ch == '.' || ch == 'e' || ch == 'E')) {
        return {Status::Malformed, pos};
      }
    }
    return {Status::Complete, end};
  }
  if (token == "true" || token == "false" || token == "null") {
    return {Status::Complete, end};
  }
  return {Status::Malformed, pos};
}

ScanResult ScanContainer(std::string_view buf, std::size_t pos) {
  SmallVector<char, 16> closers;
  for (std::size_t idx = pos; idx < buf.size(); ++idx) {
    switch (buf[idx]) {
      case '{':
        [[fallthrough]];
      case '[':
        if (closers.size() == kMaxJsonNestingDepth) {
          return {Status::TooDeep, idx};
        }
        closers.push_back(buf[idx] == '{' ? '}' : ']');
        break;
      case '}':
        [[fallthrough]];
      case ']':
        if (closers.back() != buf[idx]) {
          return {Status::Malformed, idx};
        }
        closers.pop_back();
        if (closers.empty()) {
          return {Status::Complete, idx + 1U};
        }
        break;
      case '"': {
        const auto res = ScanString(buf, idx);
        if (res.status != Status::Complete) {
          return res;
        }
        idx = res.end - 1U;
        break;
      }
      default:
        break;
    }
  }
  return {Status::Incomplete, buf.size()};
}

}  // namespace

ScanResult ScanValue(std::string_view buf, std::size_t pos, bool isFinalBlock) {
  if (pos >= buf.size()) {
    return {Status::Incomplete, pos};
  }
  switch (buf[pos]) {
    case '"':
      return ScanString(buf, pos);
    case '{':
      [[fallthrough]];
    case '[':
      return ScanContainer(buf, pos);
    default:
      if (IsScalarChar(buf[pos])) {
        return ScanScalar(buf, pos, isFinalBlock);
      }
      return {Status::Malformed, pos};
  }
}

}  // namespace pagedstream
