#include "pagedstream/pagination-strategy.hpp"

#include <cstdint>
#include <string_view>

#include "pagedstream/pagination.hpp"
#include "pagedstream/safe-cast.hpp"

namespace pagedstream {

Pagination Advance(const Pagination& current, PaginationStrategy strategy, std::uint64_t itemIndex,
                   bool isEndOfSequence) {
  switch (strategy) {
    case PaginationStrategy::PerItem: {
      if (isEndOfSequence) {
        if (current.isUnknown()) {
          return current.withTotalCount(ClampTotalCount(itemIndex == 0 ? 0 : itemIndex - 1U));
        }
        return current;
      }
      Pagination ret = current;
      ret.currentPage = SaturatingCast<std::uint32_t>(itemIndex);
      return ret;
    }
    case PaginationStrategy::PerPage: {
      if (isEndOfSequence || current.pageSize == 0 || itemIndex == 0) {
        return current;
      }
      Pagination ret = current;
      ret.currentPage = SaturatingCast<std::uint32_t>(((itemIndex - 1U) / current.pageSize) + 1U);
      return ret;
    }
    default:
      return current;
  }
}

std::string_view ToString(PaginationStrategy strategy) noexcept {
  switch (strategy) {
    case PaginationStrategy::None:
      return "none";
    case PaginationStrategy::PerItem:
      return "per-item";
    case PaginationStrategy::PerPage:
      return "per-page";
    default:
      return "unknown";
  }
}

}  // namespace pagedstream
