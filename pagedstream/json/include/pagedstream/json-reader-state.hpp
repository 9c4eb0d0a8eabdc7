#pragma once

#include <cstddef>
#include <cstdint>

namespace pagedstream {

// Resumable position of the envelope tokenizer.
// A plain value: the decoder keeps the last one returned by the tokenizer, which always sits on a token
// boundary, and hands it back verbatim once more bytes are available.
struct JsonReaderState {
  enum class Expect : std::uint8_t {
    EnvelopeStart,
    FirstKeyOrEnd,
    Key,
    Colon,
    Value,
    CommaOrEnd,
    FirstItemOrEnd,
    Item,
    ItemSeparator,
    Trailing,
  };

  // Which envelope property the next value belongs to.
  enum class Field : std::uint8_t { Other, Pagination, Items };

  // Number of bytes of the current buffer already tokenized.
  std::size_t bytesConsumed{};
  // Absolute number of bytes tokenized since the beginning of the stream.
  std::uint64_t totalBytesConsumed{};
  Expect expect{Expect::EnvelopeStart};
  Field field{Field::Other};
  // 0 outside of the envelope, 1 in the envelope object, 2 in the items array.
  std::uint8_t depth{};
  bool topLevelArray{false};
  bool paginationFound{false};
  bool itemsFound{false};
};

}  // namespace pagedstream
