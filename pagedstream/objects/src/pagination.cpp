#include "pagedstream/pagination.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "pagedstream/invalid_argument_exception.hpp"
#include "pagedstream/safe-cast.hpp"

namespace pagedstream {

Pagination Pagination::Create(std::int64_t pageSize, std::int64_t currentPage,
                              std::optional<std::string> continuationToken, std::optional<std::int64_t> totalCount) {
  if (pageSize < 0 || currentPage < 0) {
    throw invalid_argument("page size ({}) and current page ({}) must be >= 0", pageSize, currentPage);
  }
  if (totalCount && *totalCount < 0) {
    throw invalid_argument("total count ({}) must be >= 0", *totalCount);
  }
  static constexpr auto kMaxPageValue = std::numeric_limits<std::uint32_t>::max();
  if (std::cmp_greater(pageSize, kMaxPageValue) || std::cmp_greater(currentPage, kMaxPageValue)) {
    throw invalid_argument("page size ({}) or current page ({}) too large", pageSize, currentPage);
  }

  Pagination ret;
  ret.pageSize = static_cast<std::uint32_t>(pageSize);
  ret.currentPage = static_cast<std::uint32_t>(currentPage);
  ret.continuationToken = std::move(continuationToken);
  if (totalCount) {
    ret.totalCount = ClampTotalCount(static_cast<std::uint64_t>(*totalCount));
  }
  return ret;
}

Pagination Pagination::FromTotalCount(std::uint64_t totalCount) {
  Pagination ret;
  ret.totalCount = ClampTotalCount(totalCount);
  return ret;
}

Pagination Pagination::nextPage(std::optional<std::string> token) const {
  Pagination ret = *this;
  ret.currentPage = currentPage + 1U;
  ret.continuationToken = std::move(token);
  return ret;
}

Pagination Pagination::previousPage() const {
  if (!hasPreviousPage()) {
    return *this;
  }
  Pagination ret = *this;
  --ret.currentPage;
  ret.continuationToken.reset();
  return ret;
}

Pagination Pagination::withTotalCount(std::optional<count_type> count) const {
  Pagination ret = *this;
  ret.totalCount = count;
  return ret;
}

bool Pagination::isLastPage() const noexcept {
  return totalCount && pageSize > 0 &&
         std::cmp_greater_equal(static_cast<std::uint64_t>(currentPage) * pageSize, *totalCount);
}

bool Pagination::hasNextPage() const noexcept {
  return totalCount && pageSize > 0 && std::cmp_less(static_cast<std::uint64_t>(currentPage) * pageSize, *totalCount);
}

std::optional<std::uint64_t> Pagination::totalPages() const noexcept {
  if (!totalCount || pageSize == 0) {
    return std::nullopt;
  }
  const auto total = static_cast<std::uint64_t>(*totalCount);
  return (total + pageSize - 1U) / pageSize;
}

Pagination::count_type ClampTotalCount(std::uint64_t count) noexcept {
  return SaturatingCast<Pagination::count_type>(count);
}

std::string ToString(const Pagination& pagination) {
  std::string ret = std::format("page {} (size {})", pagination.currentPage, pagination.pageSize);
  if (pagination.totalCount) {
    ret.append(std::format(", total {}", *pagination.totalCount));
  } else {
    ret.append(", total unknown");
  }
  if (pagination.continuationToken) {
    ret.append(std::format(", token '{}'", *pagination.continuationToken));
  }
  return ret;
}

}  // namespace pagedstream
