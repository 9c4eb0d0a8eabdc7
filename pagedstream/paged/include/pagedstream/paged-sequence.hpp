#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <variant>
#include <vector>

#include "pagedstream/item-cursor.hpp"
#include "pagedstream/memoized-pagination.hpp"
#include "pagedstream/paged-enumerator.hpp"
#include "pagedstream/pagination-memo-policy.hpp"
#include "pagedstream/pagination-strategy.hpp"
#include "pagedstream/pagination.hpp"
#include "pagedstream/safe-cast.hpp"

namespace pagedstream {

// Where the pagination of a PagedSequence comes from.
//   - nothing (default): pagination is synthesized by materializing the items once, see PagedSequence.
//   - a known Pagination.
//   - a producer, invoked at most once (see MemoizedPagination).
class PaginationSource {
 public:
  PaginationSource() noexcept = default;

  PaginationSource(Pagination known) : _source(std::move(known)) {}  // NOLINT(google-explicit-constructor)

  explicit PaginationSource(PaginationProducer producer,
                            PaginationMemoPolicy policy = PaginationMemoPolicy::CacheFailure)
      : _source(std::move(producer)), _policy(policy) {}

  static PaginationSource FromTotalCount(std::uint64_t totalCount) {
    return {Pagination::FromTotalCount(totalCount)};
  }

  [[nodiscard]] bool empty() const noexcept { return std::holds_alternative<std::monostate>(_source); }

  // Builds the memoization cell of this source. Should not be called on an empty source.
  [[nodiscard]] MemoizedPaginationPtr makeMemo() && {
    if (auto* known = std::get_if<Pagination>(&_source)) {
      return std::make_shared<MemoizedPagination>(std::move(*known));
    }
    return std::make_shared<MemoizedPagination>(std::move(std::get<PaginationProducer>(_source)), _policy);
  }

 private:
  std::variant<std::monostate, Pagination, PaginationProducer> _source;
  PaginationMemoPolicy _policy{PaginationMemoPolicy::CacheFailure};
};

// Lazy item sequence bundled with its pagination.
//
// Enumeration is repeatable when the sequence is built from a vector or a cursor factory: each call to
// enumerate() opens a new cursor. A sequence built from a single cursor can only be enumerated once, later
// passes are empty.
//
// The pagination is computed at most once and shared by all the copies and views of a sequence.
// Without a pagination source, it is synthesized by materializing the items (page size = current count,
// page 1, total = count). This buffers the whole sequence in memory, at the first pagination request or
// the first enumeration step, and the buffered items are replayed by all passes. Prefer an explicit source
// for large sequences.
//
// Copies are cheap and share the item source and the pagination cell.
template <class T>
class PagedSequence {
 public:
  using value_type = T;
  using enumerator_type = PagedEnumerator<T>;

  PagedSequence(CursorFactory<T> factory, MemoizedPaginationPtr pagination,
                PaginationStrategy strategy = PaginationStrategy::None)
      : _factory(std::make_shared<const CursorFactory<T>>(std::move(factory))),
        _pagination(std::move(pagination)),
        _strategy(strategy) {}

  // Repeatable sequence over the given items.
  static PagedSequence FromVector(std::vector<T> items, PaginationSource source = {}) {
    auto shared = std::make_shared<const std::vector<T>>(std::move(items));
    if (source.empty()) {
      // no need to materialize anything, the count is already known
      source = PaginationSource(MaterializedPagination(shared->size()));
    }
    return {[shared] { return MakeVectorCursor(shared); }, std::move(source).makeMemo()};
  }

  // Repeatable sequence, 'factory' is called once per enumeration pass.
  static PagedSequence FromFactory(CursorFactory<T> factory, PaginationSource source = {}) {
    if (source.empty()) {
      return Materializing(std::move(factory));
    }
    return {std::move(factory), std::move(source).makeMemo()};
  }

  // Single pass sequence over an already opened cursor.
  static PagedSequence FromCursor(CursorPtr<T> cursor, PaginationSource source = {}) {
    return FromFactory(SingleUse(std::move(cursor)), std::move(source));
  }

  // Empty sequence with the given pagination.
  static PagedSequence Empty(Pagination pagination = {}) {
    return {[] { return CursorPtr<T>(std::make_unique<EmptyCursor<T>>()); },
            std::make_shared<MemoizedPagination>(std::move(pagination))};
  }

  // Wraps a cursor so that it is handed out to the first caller only, later callers get an empty cursor.
  static CursorFactory<T> SingleUse(CursorPtr<T> cursor) {
    struct Cell {
      std::mutex mutex;
      CursorPtr<T> cursor;
    };
    auto cell = std::make_shared<Cell>();
    cell->cursor = std::move(cursor);
    return [cell] {
      std::scoped_lock lock(cell->mutex);
      if (cell->cursor) {
        return std::move(cell->cursor);
      }
      return CursorPtr<T>(std::make_unique<EmptyCursor<T>>());
    };
  }

  // New view over the same item source and pagination cell, with a different default strategy.
  [[nodiscard]] PagedSequence withStrategy(PaginationStrategy strategy) const {
    PagedSequence ret = *this;
    ret._strategy = strategy;
    return ret;
  }

  [[nodiscard]] PaginationStrategy strategy() const noexcept { return _strategy; }

  // Starts a new enumeration pass, observing 'stopToken' at each step.
  [[nodiscard]] PagedEnumerator<T> enumerate(std::stop_token stopToken = {}) const {
    return PagedEnumerator<T>((*_factory)(), _pagination->snapshot(), _strategy, std::move(stopToken), _pagination);
  }

  // Best known pagination, never blocks: the empty sentinel until computed.
  [[nodiscard]] Pagination paginationSnapshot() const { return _pagination->snapshot(); }

  // Pagination future. The first caller computes it, concurrent callers share the same computation.
  [[nodiscard]] std::shared_future<Pagination> paginationAsync(std::stop_token stopToken = {}) const {
    return _pagination->getAsync(std::move(stopToken));
  }

  // Blocking pagination accessor. Throws PaginationComputationError or CancelledError.
  [[nodiscard]] Pagination pagination(std::stop_token stopToken = {}) const {
    return _pagination->get(std::move(stopToken));
  }

  [[nodiscard]] const MemoizedPaginationPtr& paginationCell() const noexcept { return _pagination; }

 private:
  static Pagination MaterializedPagination(std::size_t count) {
    Pagination ret;
    ret.pageSize = SaturatingCast<std::uint32_t>(count);
    ret.currentPage = count > 0 ? 1U : 0U;
    ret.totalCount = ClampTotalCount(count);
    return ret;
  }

  // Items collected so far are kept with their cursor, so that an interrupted materialization resumes
  // where it stopped instead of losing the items of a single pass source.
  struct Materialized {
    std::mutex mutex;
    CursorFactory<T> source;
    CursorPtr<T> cursor;
    std::vector<T> collected;
    std::shared_ptr<const std::vector<T>> items;
  };

  // Materializes the items through the pagination cell at its first step, then replays them.
  class MaterializedCursor final : public ItemCursor<T> {
   public:
    MaterializedCursor(std::shared_ptr<Materialized> materialized, MemoizedPaginationPtr pagination)
        : _materialized(std::move(materialized)), _pagination(std::move(pagination)) {}

    bool next(std::stop_token stopToken) override {
      if (!_replay) {
        static_cast<void>(_pagination->get(stopToken));
        std::scoped_lock lock(_materialized->mutex);
        _replay.emplace(_materialized->items);
      }
      return _replay->next(stopToken);
    }

    T& current() override { return _replay->current(); }

   private:
    std::shared_ptr<Materialized> _materialized;
    MemoizedPaginationPtr _pagination;
    std::optional<VectorCursor<T>> _replay;
  };

  static PagedSequence Materializing(CursorFactory<T> factory) {
    auto materialized = std::make_shared<Materialized>();
    materialized->source = std::move(factory);

    auto pagination = std::make_shared<MemoizedPagination>([materialized](std::stop_token stopToken) {
      std::scoped_lock lock(materialized->mutex);
      if (!materialized->items) {
        if (!materialized->cursor) {
          materialized->cursor = materialized->source();
        }
        while (materialized->cursor->next(stopToken)) {
          materialized->collected.push_back(std::move(materialized->cursor->current()));
        }
        materialized->items = std::make_shared<const std::vector<T>>(std::move(materialized->collected));
        materialized->cursor.reset();
      }
      return MaterializedPagination(materialized->items->size());
    });
    CursorFactory<T> cursorFactory = [materialized, pagination]() -> CursorPtr<T> {
      return std::make_unique<MaterializedCursor>(materialized, pagination);
    };
    return {std::move(cursorFactory), std::move(pagination)};
  }

  std::shared_ptr<const CursorFactory<T>> _factory;
  MemoizedPaginationPtr _pagination;
  PaginationStrategy _strategy;
};

// Drains a full enumeration pass of 'sequence' into a vector.
template <class T>
std::vector<T> ToVector(const PagedSequence<T>& sequence, std::stop_token stopToken = {}) {
  std::vector<T> ret;
  auto enumerator = sequence.enumerate(std::move(stopToken));
  while (enumerator.advance()) {
    ret.push_back(std::move(enumerator.current()));
  }
  return ret;
}

}  // namespace pagedstream
