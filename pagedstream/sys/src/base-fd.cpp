#include "pagedstream/base-fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include "pagedstream/errno-throw.hpp"
#include "pagedstream/log.hpp"

namespace pagedstream {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    while (::close(_fd) != 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
      break;
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

Pipe MakePipe() {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    ThrowChannelErrno("Unable to create a pipe");
  }
  log::debug("pipe opened, read fd # {}, write fd # {}", fds[0], fds[1]);
  return Pipe{BaseFd(fds[0]), BaseFd(fds[1])};
}

}  // namespace pagedstream
