#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

#include "pagedstream/errors.hpp"

namespace pagedstream {

// Pull based, single pass cursor over a lazy item sequence.
// Implementations may throw from next() (ChannelError, DecodeError, CancelledError...),
// which aborts the enumeration pass.
template <class T>
class ItemCursor {
 public:
  virtual ~ItemCursor() = default;

  // Moves to the next item. Returns false once the sequence is exhausted.
  virtual bool next(std::stop_token stopToken) = 0;

  // Current item, valid only after next() returned true, until the following call to next().
  // The item is owned by the cursor and may be moved out by the caller.
  virtual T& current() = 0;
};

template <class T>
using CursorPtr = std::unique_ptr<ItemCursor<T>>;

// Creates a new cursor for each enumeration pass.
template <class T>
using CursorFactory = std::function<CursorPtr<T>()>;

template <class T>
class EmptyCursor final : public ItemCursor<T> {
 public:
  bool next([[maybe_unused]] std::stop_token stopToken) override { return false; }

  T& current() override { throw InvalidStateError("empty cursor has no current item"); }
};

// Cursor over a shared, immutable vector of items. Each item is copied when reached.
template <class T>
class VectorCursor final : public ItemCursor<T> {
 public:
  explicit VectorCursor(std::shared_ptr<const std::vector<T>> items, std::size_t first = 0,
                        std::size_t last = static_cast<std::size_t>(-1))
      : _items(std::move(items)), _pos(first), _last(std::min(last, _items->size())) {}

  bool next(std::stop_token stopToken) override {
    if (stopToken.stop_requested()) {
      throw CancelledError();
    }
    if (_pos >= _last) {
      _current.reset();
      return false;
    }
    _current.emplace((*_items)[_pos++]);
    return true;
  }

  T& current() override { return *_current; }

 private:
  std::shared_ptr<const std::vector<T>> _items;
  std::size_t _pos;
  std::size_t _last;
  std::optional<T> _current;
};

// Cursor pulling items from a generator function, which returns std::nullopt once exhausted.
template <class T>
class GeneratorCursor final : public ItemCursor<T> {
 public:
  using Generator = std::function<std::optional<T>(std::stop_token)>;

  explicit GeneratorCursor(Generator generator) : _generator(std::move(generator)) {}

  bool next(std::stop_token stopToken) override {
    if (stopToken.stop_requested()) {
      throw CancelledError();
    }
    _current = _generator(stopToken);
    return _current.has_value();
  }

  T& current() override { return *_current; }

 private:
  Generator _generator;
  std::optional<T> _current;
};

template <class T>
CursorPtr<T> MakeVectorCursor(std::shared_ptr<const std::vector<T>> items) {
  return std::make_unique<VectorCursor<T>>(std::move(items));
}

}  // namespace pagedstream
