#pragma once

#include <cstddef>
#include <stop_token>
#include <string_view>

namespace pagedstream {

// Single-consumer source of bytes, modeled after a pipe reader.
//
// Contract:
//   - read() returns ALL the bytes not yet consumed, the ones returned by previous reads included,
//     followed by the newly arrived ones. It blocks only until at least one new byte arrived or
//     the channel completed.
//   - advance(n) declares that the first n bytes of the last returned buffer were consumed.
//     Unconsumed bytes are preserved for the next read.
//   - isCompleted is set alongside the final bytes: no more bytes will ever follow them.
//   - complete() is called by the consumer once it is done with the channel.
//
// Only one read may be in flight at a time. The channel does not own the underlying resource,
// callers open and close it.
class ByteReader {
 public:
  struct ReadResult {
    std::string_view buffer;
    bool isCompleted;
  };

  virtual ~ByteReader() = default;

  // Throws ChannelError on I/O failure, CancelledError if stopToken is triggered while waiting.
  virtual ReadResult read(std::stop_token stopToken) = 0;

  virtual void advance(std::size_t consumed) = 0;

  virtual void complete() noexcept = 0;
};

// Sink of bytes, modeled after a pipe writer.
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  // Writes (or queues) the whole chunk. Throws ChannelError, CancelledError.
  virtual void write(std::string_view data, std::stop_token stopToken) = 0;

  // Pushes queued bytes to the underlying resource.
  virtual void flush(std::stop_token stopToken) = 0;

  // Flushes and marks the end of the stream. Writing after completion is a ChannelError.
  virtual void complete() = 0;
};

}  // namespace pagedstream
