#pragma once

#include <cstddef>
#include <cstdint>

namespace pagedstream {

// Paginated JSON decoding configuration.
struct DecoderConfig {
  enum class Mode : std::uint8_t {
    // Items are decoded one at a time as bytes arrive, memory is bounded by the largest item.
    Streaming,
    // The whole payload is read and converted in one shot. Only suitable for small, bounded payloads.
    // Strict: an item that cannot be converted fails the whole decoding.
    Buffered,
  };

  void validate() const;

  DecoderConfig& withInitialBufferSize(std::size_t bytes);

  DecoderConfig& withMaxBufferSize(std::size_t bytes);

  DecoderConfig& withReadChunkSize(std::size_t bytes);

  DecoderConfig& withTopLevelArray(bool on = true);

  DecoderConfig& withUnknownItemFields(bool allow = true);

  DecoderConfig& withMode(Mode mode);

  DecoderConfig& withMaxBufferedPayloadBytes(std::size_t bytes);

  // Initial capacity of the parsing arena. It grows exponentially when a single value does not fit.
  std::size_t initialBufferSize{16UL * 1024};

  // Maximum capacity of the parsing arena, which bounds the size of a single JSON value
  // (one item, or the pagination object). 0 => unlimited. Default: 64 MiB.
  std::size_t maxBufferSize{64UL * 1024 * 1024};

  // Maximum number of bytes moved from the channel to the arena per pull. 0 => as much as fits.
  std::size_t readChunkSize{0};

  // Accept a bare JSON array as payload, decoded as the item sequence with empty pagination.
  bool acceptTopLevelArray{false};

  // Whether item objects may carry fields unknown to the item type.
  bool allowUnknownItemFields{true};

  Mode mode{Mode::Streaming};

  // Upper bound of the payload size in Buffered mode. Default: 16 MiB.
  std::size_t maxBufferedPayloadBytes{16UL * 1024 * 1024};
};

}  // namespace pagedstream
