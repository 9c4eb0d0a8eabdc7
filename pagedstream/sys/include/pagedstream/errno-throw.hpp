#pragma once

#include <cerrno>
#include <format>
#include <string>
#include <system_error>
#include <utility>

#include "pagedstream/errors.hpp"

namespace pagedstream {

// Capture errno immediately and throw a ChannelError with a formatted message followed by the errno description.
// Usage: ThrowChannelErrno("read failed on fd # {}", fd);
template <typename... Args>
[[noreturn]] void ThrowChannelErrno(std::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  const std::string context = std::format(fmt, std::forward<Args>(args)...);
  throw ChannelError(savedErr, "{}: {}", context, std::generic_category().message(savedErr));
}

}  // namespace pagedstream
