#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

#include "pagedstream/errors.hpp"
#include "pagedstream/item-cursor.hpp"
#include "pagedstream/paged-sequence.hpp"
#include "pagedstream/pagination-memo-policy.hpp"
#include "pagedstream/pagination.hpp"

namespace pagedstream {

// Query like item source exposing its own offset / limit window and the total number of items
// matching it regardless of the window.
template <class T>
class PageableQuery {
 public:
  virtual ~PageableQuery() = default;

  // Number of items skipped before the window, nullopt when not set.
  [[nodiscard]] virtual std::optional<std::uint64_t> offset() const = 0;

  // Maximum number of items of the window, nullopt when not set.
  [[nodiscard]] virtual std::optional<std::uint64_t> limit() const = 0;

  // Total number of items, ignoring offset and limit. May be costly (a COUNT query for instance).
  [[nodiscard]] virtual std::uint64_t countAll(std::stop_token stopToken) const = 0;

  // Opens a cursor over the items of the window.
  [[nodiscard]] virtual CursorPtr<T> open() const = 0;
};

// Pagination of the window [offset, offset + limit) of a result of 'totalCount' items.
//   - page size is the limit, 0 when not set
//   - current page is offset / limit + 1 when limit > 0 and offset is set, otherwise 1 if paginated, else 0
//   - continuation token is 'offset:<offset + limit>' when both offset and limit are > 0
[[nodiscard]] Pagination SynthesizeQueryPagination(std::optional<std::uint64_t> offset,
                                                   std::optional<std::uint64_t> limit, std::uint64_t totalCount);

// Paged sequence over 'query', whose pagination is synthesized from the query window and its count.
// The count is only queried when the pagination is requested.
template <class T>
PagedSequence<T> MakePagedSequence(std::shared_ptr<const PageableQuery<T>> query,
                                   PaginationMemoPolicy policy = PaginationMemoPolicy::CacheFailure) {
  auto producer = [query](std::stop_token stopToken) {
    return SynthesizeQueryPagination(query->offset(), query->limit(), query->countAll(stopToken));
  };
  CursorFactory<T> factory = [query] { return query->open(); };
  return {std::move(factory), std::make_shared<MemoizedPagination>(std::move(producer), policy)};
}

// In-memory PageableQuery.
template <class T>
class VectorQuery final : public PageableQuery<T> {
 public:
  explicit VectorQuery(std::vector<T> items) : _items(std::make_shared<const std::vector<T>>(std::move(items))) {}

  VectorQuery& withOffset(std::uint64_t offset) {
    _offset = offset;
    return *this;
  }

  VectorQuery& withLimit(std::uint64_t limit) {
    _limit = limit;
    return *this;
  }

  [[nodiscard]] std::optional<std::uint64_t> offset() const override { return _offset; }

  [[nodiscard]] std::optional<std::uint64_t> limit() const override { return _limit; }

  [[nodiscard]] std::uint64_t countAll(std::stop_token stopToken) const override {
    if (stopToken.stop_requested()) {
      throw CancelledError();
    }
    ++_nbCountQueries;
    return _items->size();
  }

  [[nodiscard]] CursorPtr<T> open() const override {
    const auto first = static_cast<std::size_t>(std::min<std::uint64_t>(_offset.value_or(0), _items->size()));
    std::size_t last = _items->size();
    if (_limit && *_limit < last - first) {
      last = first + static_cast<std::size_t>(*_limit);
    }
    return std::make_unique<VectorCursor<T>>(_items, first, last);
  }

  // Number of calls to countAll.
  [[nodiscard]] std::size_t nbCountQueries() const noexcept { return _nbCountQueries; }

 private:
  std::shared_ptr<const std::vector<T>> _items;
  std::optional<std::uint64_t> _offset;
  std::optional<std::uint64_t> _limit;
  mutable std::size_t _nbCountQueries{};
};

}  // namespace pagedstream
