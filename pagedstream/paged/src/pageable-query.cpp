#include "pagedstream/pageable-query.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <optional>

#include "pagedstream/pagination.hpp"
#include "pagedstream/safe-cast.hpp"

namespace pagedstream {

Pagination SynthesizeQueryPagination(std::optional<std::uint64_t> offset, std::optional<std::uint64_t> limit,
                                     std::uint64_t totalCount) {
  Pagination ret;
  ret.totalCount = ClampTotalCount(totalCount);
  const std::uint64_t pageSize = limit.value_or(0);
  ret.pageSize = SaturatingCast<std::uint32_t>(pageSize);
  if (pageSize > 0 && offset) {
    ret.currentPage = SaturatingCast<std::uint32_t>((*offset / pageSize) + 1U);
  } else {
    ret.currentPage = pageSize > 0 ? 1U : 0U;
  }
  if (pageSize > 0 && offset.value_or(0) > 0) {
    constexpr auto kMaxOffset = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t nextOffset = pageSize > kMaxOffset - *offset ? kMaxOffset : *offset + pageSize;
    ret.continuationToken = std::format("offset:{}", nextOffset);
  }
  return ret;
}

}  // namespace pagedstream
