#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace pagedstream {

// Base exception of pagedstream with an inline, bounded message storage.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 127;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg.data(), str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto res =
        std::format_to_n(_msg.data(), static_cast<std::ptrdiff_t>(kMsgMaxLen), fmt, std::forward<Args>(args)...);
    if (std::cmp_greater(res.size, kMsgMaxLen)) {
      std::fill_n(_msg.data() + kMsgMaxLen - 3, 3, '.');
      _msg[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg.data(); }

 private:
  std::array<char, kMsgMaxLen + 1> _msg;
};

}  // namespace pagedstream
