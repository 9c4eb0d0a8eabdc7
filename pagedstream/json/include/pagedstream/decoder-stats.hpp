#pragma once

#include <cstddef>
#include <cstdint>

namespace pagedstream {

struct DecoderStats {
  // Items successfully converted.
  std::uint64_t nbItemsDecoded{};
  // Items skipped because they could not be converted to the item type.
  std::uint64_t nbItemsSkipped{};
  // Bytes read from the channel.
  std::uint64_t nbBytesConsumed{};
  // Largest capacity reached by the parsing arena.
  std::size_t peakBufferCapacity{};
};

}  // namespace pagedstream
