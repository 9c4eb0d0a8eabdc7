#include "pagedstream/fd-channel.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string_view>
#include <utility>

#include "pagedstream/errno-throw.hpp"
#include "pagedstream/errors.hpp"
#include "pagedstream/invalid_argument_exception.hpp"
#include "pagedstream/log.hpp"

namespace pagedstream {

namespace {

// Waits until 'fd' is ready for 'events', checking the stop token every 'pollInterval'.
void WaitReady(int fd, short events, std::chrono::milliseconds pollInterval, std::stop_token stopToken) {
  pollfd pfd{fd, events, 0};
  while (true) {
    if (stopToken.stop_requested()) {
      throw CancelledError();
    }
    const int ret = ::poll(&pfd, 1, static_cast<int>(pollInterval.count()));
    if (ret > 0) {
      // POLLHUP and POLLERR are reported by the next read / write call
      return;
    }
    if (ret == -1 && errno != EINTR) {
      ThrowChannelErrno("poll failed on fd # {}", fd);
    }
  }
}

}  // namespace

FdByteReader::FdByteReader(int fd, std::size_t readChunkSize, std::chrono::milliseconds pollInterval)
    : _buf(readChunkSize), _fd(fd), _readChunkSize(readChunkSize), _pollInterval(pollInterval) {
  if (readChunkSize == 0) {
    throw invalid_argument("read chunk size should be strictly positive");
  }
}

ByteReader::ReadResult FdByteReader::read(std::stop_token stopToken) {
  if (_eof) {
    return {std::string_view(_buf), true};
  }
  if (std::exchange(_hasUnreadBytes, false)) {
    // part of the previous view was consumed, the rest is handed out again without waiting for new bytes
    return {std::string_view(_buf), false};
  }
  _buf.ensureAvailableCapacityExponential(_readChunkSize);
  while (true) {
    WaitReady(_fd, POLLIN, _pollInterval, stopToken);
    const auto nbRead = ::read(_fd, _buf.data() + _buf.size(), _buf.availableCapacity());
    if (nbRead > 0) {
      _buf.addSize(static_cast<std::size_t>(nbRead));
      log::trace("read {} bytes from fd # {}", nbRead, _fd);
      return {std::string_view(_buf), false};
    }
    if (nbRead == 0) {
      log::debug("end of stream reached on fd # {}", _fd);
      _eof = true;
      return {std::string_view(_buf), true};
    }
    if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
      ThrowChannelErrno("read failed on fd # {}", _fd);
    }
  }
}

void FdByteReader::advance(std::size_t consumed) {
  if (consumed > _buf.size()) {
    throw invalid_argument("cannot advance by {} bytes, only {} bytes are buffered", consumed, _buf.size());
  }
  _buf.erase_front(consumed);
  _hasUnreadBytes = consumed != 0 && !_buf.empty();
}

void FdByteReader::complete() noexcept {
  if (!_completed) {
    _completed = true;
    _buf.shrinkToZero();
  }
}

FdByteWriter::FdByteWriter(int fd, std::size_t maxQueuedBytes, std::chrono::milliseconds pollInterval)
    : _fd(fd), _maxQueuedBytes(maxQueuedBytes), _pollInterval(pollInterval) {}

void FdByteWriter::write(std::string_view data, std::stop_token stopToken) {
  if (_completed) {
    throw ChannelError(0, "write of {} bytes on fd # {} after completion", data.size(), _fd);
  }
  _queue.append(data);
  if (_queue.size() > _maxQueuedBytes) {
    flush(stopToken);
  }
}

void FdByteWriter::flush(std::stop_token stopToken) {
  if (!_queue.empty()) {
    writeAll(std::string_view(_queue), stopToken);
    _queue.clear();
  }
}

void FdByteWriter::complete() {
  if (!_completed) {
    flush(std::stop_token{});
    _completed = true;
  }
}

void FdByteWriter::writeAll(std::string_view data, std::stop_token stopToken) {
  while (!data.empty()) {
    WaitReady(_fd, POLLOUT, _pollInterval, stopToken);
    const auto nbWritten = ::write(_fd, data.data(), data.size());
    if (nbWritten >= 0) {
      data.remove_prefix(static_cast<std::size_t>(nbWritten));
      continue;
    }
    if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
      ThrowChannelErrno("write failed on fd # {}", _fd);
    }
  }
}

}  // namespace pagedstream
