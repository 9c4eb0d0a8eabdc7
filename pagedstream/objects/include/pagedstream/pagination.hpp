#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pagedstream {

// Pagination metadata travelling alongside a paged item sequence.
// Value type: all derivations return a new Pagination, nothing is mutated in place.
// The default constructed value is the 'empty' sentinel (everything unknown).
struct Pagination {
  // Count type exposed to callers. Wire counts exceeding its range are clamped, see ClampTotalCount.
  using count_type = std::int32_t;

  // Builds a pagination from signed values, typically coming from user input.
  // Throws invalid_argument if any value is negative or does not fit.
  static Pagination Create(std::int64_t pageSize, std::int64_t currentPage,
                           std::optional<std::string> continuationToken = std::nullopt,
                           std::optional<std::int64_t> totalCount = std::nullopt);

  // Pagination of a whole, non paginated, result of 'totalCount' items.
  static Pagination FromTotalCount(std::uint64_t totalCount);

  static Pagination Empty() noexcept { return {}; }

  // Next page, with the continuation token given by the producer.
  [[nodiscard]] Pagination nextPage(std::optional<std::string> token = std::nullopt) const;

  // Previous page (continuation token dropped), or an unchanged copy if there is no previous page.
  [[nodiscard]] Pagination previousPage() const;

  [[nodiscard]] Pagination withTotalCount(std::optional<count_type> count) const;

  // Total count is not known (yet).
  [[nodiscard]] bool isUnknown() const noexcept { return !totalCount; }

  [[nodiscard]] std::uint64_t skip() const noexcept {
    return pageSize > 0 && currentPage > 0 ? static_cast<std::uint64_t>(currentPage - 1) * pageSize : 0;
  }

  [[nodiscard]] std::uint32_t take() const noexcept { return pageSize; }

  [[nodiscard]] bool hasContinuation() const noexcept { return continuationToken && !continuationToken->empty(); }

  [[nodiscard]] bool isFirstPage() const noexcept { return currentPage <= 1; }

  [[nodiscard]] bool hasPreviousPage() const noexcept { return currentPage > 1; }

  [[nodiscard]] bool isLastPage() const noexcept;

  [[nodiscard]] bool hasNextPage() const noexcept;

  [[nodiscard]] bool isPaginated() const noexcept { return skip() > 0 || take() > 0; }

  // ceil(totalCount / pageSize) when both are known, nullopt otherwise.
  [[nodiscard]] std::optional<std::uint64_t> totalPages() const noexcept;

  bool operator==(const Pagination&) const noexcept = default;

  // 0 means unknown / not paginated.
  std::uint32_t pageSize{};
  // 1-based, 0 means unknown.
  std::uint32_t currentPage{};
  // Opaque token to give back to the producer to get the next page.
  std::optional<std::string> continuationToken;
  std::optional<count_type> totalCount;
};

// Maps a wire total count to Pagination::count_type, saturating at its maximum.
[[nodiscard]] Pagination::count_type ClampTotalCount(std::uint64_t count) noexcept;

// Short human readable representation, for logs.
[[nodiscard]] std::string ToString(const Pagination& pagination);

}  // namespace pagedstream
