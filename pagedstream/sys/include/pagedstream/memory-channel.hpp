#pragma once

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>

#include "pagedstream/byte-channel.hpp"

namespace pagedstream {

// ByteReader over an in-memory payload that is released 'chunkSize' bytes at a time, which
// reproduces the partial reads of a network transport. chunkSize 0 releases the whole payload
// at the first read. The payload is not copied and must outlive the reader.
class MemoryByteReader final : public ByteReader {
 public:
  explicit MemoryByteReader(std::string_view payload, std::size_t chunkSize = 0) noexcept
      : _payload(payload), _chunkSize(chunkSize == 0 ? payload.size() : chunkSize) {}

  ReadResult read(std::stop_token stopToken) override;

  void advance(std::size_t consumed) override;

  void complete() noexcept override { ++_nbCompleteCalls; }

  [[nodiscard]] std::size_t nbReads() const noexcept { return _nbReads; }

  [[nodiscard]] std::size_t nbCompleteCalls() const noexcept { return _nbCompleteCalls; }

  // Number of payload bytes declared consumed so far.
  [[nodiscard]] std::size_t consumed() const noexcept { return _consumed; }

 private:
  std::string_view _payload;
  std::size_t _chunkSize;
  std::size_t _consumed{};
  std::size_t _exposed{};
  std::size_t _nbReads{};
  std::size_t _nbCompleteCalls{};
};

// ByteWriter accumulating all written bytes in a std::string.
class StringByteWriter final : public ByteWriter {
 public:
  void write(std::string_view data, std::stop_token stopToken) override;

  void flush(std::stop_token stopToken) override;

  void complete() override;

  [[nodiscard]] const std::string& str() const noexcept { return _out; }

  // Bytes which were part of a flush, the remaining ones are still queued.
  [[nodiscard]] std::size_t flushedSize() const noexcept { return _flushedSize; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  [[nodiscard]] std::size_t nbFlushes() const noexcept { return _nbFlushes; }

  [[nodiscard]] bool completed() const noexcept { return _completed; }

 private:
  std::string _out;
  std::size_t _flushedSize{};
  std::size_t _nbWrites{};
  std::size_t _nbFlushes{};
  bool _completed{false};
};

}  // namespace pagedstream
