#pragma once

#include <cstdint>
#include <stop_token>
#include <utility>

#include "pagedstream/errors.hpp"
#include "pagedstream/item-cursor.hpp"
#include "pagedstream/memoized-pagination.hpp"
#include "pagedstream/pagination-strategy.hpp"
#include "pagedstream/pagination.hpp"

namespace pagedstream {

// One enumeration pass over a paged sequence.
//
// Owns its inner cursor, released by dispose() (or destruction), and a running pagination updated
// by the current strategy as items are pulled. The strategy can be changed between steps, the new one
// applies from the next step on.
//
// When created before the pagination of its sequence is known (typically a decoder backed sequence),
// the running pagination is rebased on the sequence pagination as soon as it gets resolved.
//
// Not thread safe: a single consumer drives an enumerator.
template <class T>
class PagedEnumerator {
 public:
  PagedEnumerator(CursorPtr<T> inner, Pagination initial, PaginationStrategy strategy = PaginationStrategy::None,
                  std::stop_token stopToken = {}, MemoizedPaginationPtr sequencePagination = {})
      : _inner(std::move(inner)),
        _pagination(std::move(initial)),
        _sequencePagination(std::move(sequencePagination)),
        _stopToken(std::move(stopToken)),
        _strategy(strategy),
        _rebased(_sequencePagination == nullptr) {
    if (!_inner) {
      _inner = std::make_unique<EmptyCursor<T>>();
    }
  }

  PagedEnumerator(const PagedEnumerator&) = delete;
  PagedEnumerator& operator=(const PagedEnumerator&) = delete;
  PagedEnumerator(PagedEnumerator&&) noexcept = default;
  PagedEnumerator& operator=(PagedEnumerator&&) noexcept = default;

  ~PagedEnumerator() { dispose(); }

  // Moves to the next item. Returns false when the sequence is exhausted, in which case the end of
  // sequence pagination update is applied (once).
  // Throws CancelledError if the stop token is triggered, ObjectDisposedError after dispose(), and
  // propagates any error of the inner cursor, which aborts the pass.
  bool advance() {
    if (_disposed) {
      throw ObjectDisposedError("advance called on a disposed enumerator");
    }
    if (_stopToken.stop_requested()) {
      throw CancelledError();
    }
    if (_ended) {
      return false;
    }
    const bool hasItem = _inner->next(_stopToken);
    rebaseIfResolved();
    if (!hasItem) {
      _ended = true;
      _hasCurrent = false;
      _pagination = Advance(_pagination, _strategy, _itemIndex + 1U, true);
      return false;
    }
    ++_itemIndex;
    _hasCurrent = true;
    _pagination = Advance(_pagination, _strategy, _itemIndex, false);
    return true;
  }

  // Current item, only valid after advance() returned true.
  T& current() {
    if (_disposed) {
      throw ObjectDisposedError("current called on a disposed enumerator");
    }
    if (!_hasCurrent) {
      throw InvalidStateError("no current item, advance has not returned true");
    }
    return _inner->current();
  }

  [[nodiscard]] const Pagination& pagination() const noexcept { return _pagination; }

  [[nodiscard]] PaginationStrategy strategy() const noexcept { return _strategy; }

  void setStrategy(PaginationStrategy strategy) noexcept { _strategy = strategy; }

  // Number of items produced so far.
  [[nodiscard]] std::uint64_t itemIndex() const noexcept { return _itemIndex; }

  [[nodiscard]] bool disposed() const noexcept { return _disposed; }

  // Releases the inner cursor. Idempotent.
  void dispose() noexcept {
    if (!_disposed) {
      _disposed = true;
      _hasCurrent = false;
      _inner.reset();
    }
  }

 private:
  void rebaseIfResolved() {
    if (_rebased) {
      return;
    }
    auto resolved = _sequencePagination->resolved();
    if (resolved) {
      _rebased = true;
      // replay the strategy up to the items already produced
      _pagination = _itemIndex == 0 ? std::move(*resolved) : Advance(*resolved, _strategy, _itemIndex, false);
    }
  }

  CursorPtr<T> _inner;
  Pagination _pagination;
  MemoizedPaginationPtr _sequencePagination;
  std::stop_token _stopToken;
  std::uint64_t _itemIndex{};
  PaginationStrategy _strategy;
  bool _rebased;
  bool _hasCurrent{false};
  bool _ended{false};
  bool _disposed{false};
};

}  // namespace pagedstream
