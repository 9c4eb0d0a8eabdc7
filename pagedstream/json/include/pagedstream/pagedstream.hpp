// pagedstream Umbrella Header
//
// Include this single header to pull in the public API:
//   - Pagination record, strategies and configuration types
//   - Paged sequences and their enumerators
//   - Streaming JSON decoder and encoder of the paginated envelope
//   - Byte channels over file descriptors and memory
//
// Each re-exported header line is annotated with IWYU pragma: export so that include-cleaner
// accepts direct use of their symbols. Include the individual headers instead for finer control.
//
// Usage Example:
//    #include <pagedstream/pagedstream.hpp>
//    using namespace pagedstream;
//    FdByteReader reader(STDIN_FILENO);
//    PagedJsonDecoder<Book> decoder(reader);
//    auto pagination = decoder.sequence().pagination();
//    for (auto enumerator = decoder.sequence().enumerate(); enumerator.advance();) {
//      use(enumerator.current());
//    }

#pragma once

// Pagination
#include "pagedstream/pagination-memo-policy.hpp"  // IWYU pragma: export
#include "pagedstream/pagination-strategy.hpp"     // IWYU pragma: export
#include "pagedstream/pagination.hpp"              // IWYU pragma: export

// Paged sequences
#include "pagedstream/item-cursor.hpp"          // IWYU pragma: export
#include "pagedstream/memoized-pagination.hpp"  // IWYU pragma: export
#include "pagedstream/pageable-query.hpp"       // IWYU pragma: export
#include "pagedstream/paged-enumerator.hpp"     // IWYU pragma: export
#include "pagedstream/paged-sequence.hpp"       // IWYU pragma: export

// JSON codec & configuration
#include "pagedstream/decoder-config.hpp"      // IWYU pragma: export
#include "pagedstream/decoder-stats.hpp"       // IWYU pragma: export
#include "pagedstream/encoder-config.hpp"      // IWYU pragma: export
#include "pagedstream/paged-json-decoder.hpp"  // IWYU pragma: export
#include "pagedstream/paged-json-encoder.hpp"  // IWYU pragma: export

// Byte channels
#include "pagedstream/base-fd.hpp"         // IWYU pragma: export
#include "pagedstream/byte-channel.hpp"    // IWYU pragma: export
#include "pagedstream/fd-channel.hpp"      // IWYU pragma: export
#include "pagedstream/memory-channel.hpp"  // IWYU pragma: export

// Errors & logging
#include "pagedstream/errors.hpp"  // IWYU pragma: export
#include "pagedstream/log.hpp"     // IWYU pragma: export
