#pragma once

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string_view>

#include "pagedstream/byte-channel.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

// ByteReader reading from a file descriptor (pipe, socket, file).
// The descriptor is not owned. Blocking waits are split in slices of 'pollInterval' so that
// a stop request is observed within that delay.
// A read following a partial advance returns the remaining bytes immediately. The descriptor is only
// waited for when the previous view was either fully consumed or not consumed at all.
class FdByteReader final : public ByteReader {
 public:
  static constexpr std::size_t kDefaultReadChunkSize = 16UL * 1024;
  static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

  explicit FdByteReader(int fd, std::size_t readChunkSize = kDefaultReadChunkSize,
                        std::chrono::milliseconds pollInterval = kDefaultPollInterval);

  ReadResult read(std::stop_token stopToken) override;

  void advance(std::size_t consumed) override;

  void complete() noexcept override;

  [[nodiscard]] int fd() const noexcept { return _fd; }

 private:
  RawChars _buf;
  int _fd;
  std::size_t _readChunkSize;
  std::chrono::milliseconds _pollInterval;
  bool _eof{false};
  bool _hasUnreadBytes{false};
  bool _completed{false};
};

// ByteWriter writing to a file descriptor. Writes are queued and pushed on flush, or as soon as
// more than 'maxQueuedBytes' are queued. The descriptor is not owned, and complete() does not close it.
class FdByteWriter final : public ByteWriter {
 public:
  static constexpr std::size_t kDefaultMaxQueuedBytes = 64UL * 1024;
  static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

  explicit FdByteWriter(int fd, std::size_t maxQueuedBytes = kDefaultMaxQueuedBytes,
                        std::chrono::milliseconds pollInterval = kDefaultPollInterval);

  void write(std::string_view data, std::stop_token stopToken) override;

  void flush(std::stop_token stopToken) override;

  void complete() override;

  [[nodiscard]] int fd() const noexcept { return _fd; }

  [[nodiscard]] std::size_t nbQueuedBytes() const noexcept { return _queue.size(); }

 private:
  void writeAll(std::string_view data, std::stop_token stopToken);

  RawChars _queue;
  int _fd;
  std::size_t _maxQueuedBytes;
  std::chrono::milliseconds _pollInterval;
  bool _completed{false};
};

}  // namespace pagedstream
