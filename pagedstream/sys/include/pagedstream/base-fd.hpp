#pragma once

namespace pagedstream {

// Simple RAII class wrapping a POSIX file descriptor.
// Byte channels never own their descriptor: callers keep a BaseFd (or any other owner) alive
// for the duration of the decoding / encoding pass and close it when done.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  [[nodiscard]] int release() noexcept;

  // Close the underlying file descriptor immediately. Idempotent.
  // Closing the write end of a pipe is how a producer signals completion to a FdByteReader.
  void close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

struct Pipe {
  BaseFd readEnd;
  BaseFd writeEnd;
};

// Creates a close-on-exec pipe. Throws ChannelError on failure.
Pipe MakePipe();

}  // namespace pagedstream
