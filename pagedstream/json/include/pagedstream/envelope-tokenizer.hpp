#pragma once

#include <cstdint>
#include <string_view>

#include "pagedstream/json-reader-state.hpp"

namespace pagedstream {

struct EnvelopeToken {
  enum class Kind : std::uint8_t {
    // The buffer ends in the middle of a token. 'state' is the position before that token.
    NeedMoreData,
    // 'value' is the JSON value of the pagination property.
    Pagination,
    // 'value' is the JSON value of one element of the items array.
    Item,
    // End of the payload, only returned for the final block.
    End,
  };

  Kind kind;
  std::string_view value;
  JsonReaderState state;
};

// Advances the tokenizer of the paginated envelope
//   {"pagination": {...}, "items": [ <item>, ... ], <other properties are skipped>}
// over 'buffer', starting at 'state.bytesConsumed', up to the next value of interest.
// Values are returned as views into 'buffer'.
// 'isFinalBlock' tells that no byte will follow 'buffer'.
// With 'acceptTopLevelArray', a bare JSON array is also accepted as the items array.
// Throws DecodeError on malformed or truncated payload.
[[nodiscard]] EnvelopeToken ReadEnvelopeToken(std::string_view buffer, bool isFinalBlock, JsonReaderState state,
                                              bool acceptTopLevelArray);

}  // namespace pagedstream
