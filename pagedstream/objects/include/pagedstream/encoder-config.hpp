#pragma once

#include <cstddef>

namespace pagedstream {

// Paginated JSON encoding configuration.
struct EncoderConfig {
  void validate() const;

  EncoderConfig& withItemBufferInitialCapacity(std::size_t bytes);

  EncoderConfig& withBytesPendingThreshold(std::size_t bytes);

  EncoderConfig& withFlushEveryItem(bool on = true);

  EncoderConfig& withCompleteWriter(bool on = true);

  // Initial capacity of the output buffer in which items are serialized before being written.
  std::size_t itemBufferInitialCapacity{4UL * 1024};

  // The writer is flushed as soon as more than this number of bytes were written since the last flush,
  // whatever the number of items. Default: 32 KiB.
  std::size_t bytesPendingThreshold{32UL * 1024};

  // Flush the writer after each item. Lowest latency, highest overhead.
  bool flushEveryItem{false};

  // Whether the encoder completes the writer once the envelope is fully written.
  // Disable it to write several envelopes (or other data) on the same writer.
  bool completeWriter{true};
};

}  // namespace pagedstream
