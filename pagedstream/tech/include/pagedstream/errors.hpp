#pragma once

#include <cstdint>
#include <format>
#include <utility>

#include "pagedstream/exception.hpp"

namespace pagedstream {

// I/O failure while reading from or writing to a byte channel. Never retried internally.
class ChannelError : public exception {
 public:
  template <typename... Args>
  explicit ChannelError(int errnum, std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...), _errnum(errnum) {}

  // errno value captured at failure time, 0 when not caused by a system call.
  [[nodiscard]] int errnum() const noexcept { return _errnum; }

 private:
  int _errnum;
};

// Malformed top-level JSON structure. Aborts the current decoding pass.
class DecodeError : public exception {
 public:
  template <typename... Args>
  explicit DecodeError(std::uint64_t offset, std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...), _offset(offset) {}

  // Absolute position in the byte stream where the error was detected.
  [[nodiscard]] std::uint64_t offset() const noexcept { return _offset; }

 private:
  std::uint64_t _offset;
};

// One item could not be converted to its target type. The decoder skips such items.
class ItemConversionError : public exception {
 public:
  using exception::exception;
};

// Cooperative cancellation was observed.
class CancelledError : public exception {
 public:
  CancelledError() noexcept : exception("operation cancelled") {}

  using exception::exception;
};

// The pagination producing closure failed. Every caller awaiting the computation observes it.
class PaginationComputationError : public exception {
 public:
  using exception::exception;
};

// Use of an enumerator after dispose().
class ObjectDisposedError : public exception {
 public:
  using exception::exception;
};

// Call not valid in the current state of its object, like reading the current item of a cursor that is not on one.
class InvalidStateError : public exception {
 public:
  using exception::exception;
};

}  // namespace pagedstream
