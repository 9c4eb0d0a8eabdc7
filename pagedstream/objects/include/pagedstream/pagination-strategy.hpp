#pragma once

#include <cstdint>
#include <string_view>

#include "pagedstream/pagination.hpp"

namespace pagedstream {

// How an enumerator updates its running pagination as items are pulled.
enum class PaginationStrategy : std::uint8_t {
  // Pagination is reported as given by the producer.
  None,
  // currentPage follows the 1-based index of the current item. At the end of the sequence, an unknown
  // total count becomes the number of produced items.
  PerItem,
  // currentPage is the page of the current item, according to pageSize. No-op when pageSize is 0.
  PerPage,
};

// Returns the pagination after the item of 1-based index 'itemIndex' was pulled.
// When 'isEndOfSequence' is true, 'itemIndex' is the index the next item would have had.
[[nodiscard]] Pagination Advance(const Pagination& current, PaginationStrategy strategy, std::uint64_t itemIndex,
                                 bool isEndOfSequence);

[[nodiscard]] std::string_view ToString(PaginationStrategy strategy) noexcept;

}  // namespace pagedstream
