#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pagedstream/buffer-pool.hpp"
#include "pagedstream/byte-channel.hpp"
#include "pagedstream/decoder-config.hpp"
#include "pagedstream/decoder-stats.hpp"
#include "pagedstream/envelope-tokenizer.hpp"
#include "pagedstream/errors.hpp"
#include "pagedstream/item-cursor.hpp"
#include "pagedstream/json-reader-state.hpp"
#include "pagedstream/json-scanner.hpp"
#include "pagedstream/json-serializer.hpp"
#include "pagedstream/log.hpp"
#include "pagedstream/memoized-pagination.hpp"
#include "pagedstream/paged-sequence.hpp"
#include "pagedstream/pagination-json.hpp"
#include "pagedstream/pagination.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

// Whole envelope, used by the buffered decoding mode.
template <class T>
struct BufferedEnvelope {
  std::optional<PaginationWire> pagination;
  std::optional<std::vector<T>> items;
};

// Incremental decoding state of one paginated JSON payload, shared by the cursor and the pagination
// producer of the decoded sequence. All accesses are serialized by a mutex, the byte channel being
// single consumer. A caller waiting for that mutex still observes its own stop token.
template <class T>
class PagedJsonStream {
 public:
  PagedJsonStream(ByteReader& reader, const DecoderConfig& config, BufferPool& pool)
      : _reader(&reader), _pool(&pool), _config(config) {}

  PagedJsonStream(const PagedJsonStream&) = delete;
  PagedJsonStream& operator=(const PagedJsonStream&) = delete;
  PagedJsonStream(PagedJsonStream&&) = delete;
  PagedJsonStream& operator=(PagedJsonStream&&) = delete;

  ~PagedJsonStream() = default;

  void setPaginationCell(const MemoizedPaginationPtr& pagination) { _paginationCell = pagination; }

  // Next item, std::nullopt at the end of the items.
  std::optional<T> nextItem(std::stop_token stopToken) {
    const auto lock = lockObserving(stopToken);
    if (!_pending.empty()) {
      std::optional<T> item(std::move(_pending.front()));
      _pending.pop_front();
      return item;
    }
    std::optional<T> item;
    while (step(stopToken, item) != EnvelopeToken::Kind::End) {
      if (item) {
        return item;
      }
    }
    return std::nullopt;
  }

  // Parses the payload until the pagination is found, keeping the items met on the way for nextItem.
  Pagination primePagination(std::stop_token stopToken) {
    const auto lock = lockObserving(stopToken);
    std::optional<T> item;
    while (!_pagination && step(stopToken, item) != EnvelopeToken::Kind::End) {
      if (item) {
        log::debug("pagination not found yet, keeping item #{} for later", _stats.nbItemsDecoded);
        _pending.push_back(std::move(*item));
        item.reset();
      }
    }
    return _pagination.value_or(Pagination{});
  }

  [[nodiscard]] DecoderStats stats() const {
    std::scoped_lock lock(_mutex);
    return _stats;
  }

 private:
  static constexpr std::chrono::milliseconds kLockSlice{10};

  // Another caller may hold the mutex while blocked on the channel for a long time.
  std::unique_lock<std::timed_mutex> lockObserving(const std::stop_token& stopToken) {
    std::unique_lock<std::timed_mutex> lock(_mutex, std::defer_lock);
    while (!lock.try_lock_for(kLockSlice)) {
      if (stopToken.stop_requested()) {
        throw CancelledError();
      }
    }
    return lock;
  }

  // Advances to the next token of interest, reading from the channel as needed.
  // On Item, 'item' is set unless the item could not be converted.
  EnvelopeToken::Kind step(std::stop_token stopToken, std::optional<T>& item) {
    if (_failure) {
      std::rethrow_exception(_failure);
    }
    if (_finished) {
      return EnvelopeToken::Kind::End;
    }
    try {
      return stepUnchecked(stopToken, item);
    } catch (const CancelledError&) {
      // the reader state sits on a token boundary, decoding can be resumed later
      throw;
    } catch (const std::exception& ex) {
      log::warn("paginated JSON decoding aborted: {}", ex.what());
      _failure = std::current_exception();
      finalize();
      throw;
    }
  }

  EnvelopeToken::Kind stepUnchecked(std::stop_token stopToken, std::optional<T>& item) {
    if (!_arena.active()) {
      _arena = _pool->acquire(_config.initialBufferSize);
      updatePeakCapacity();
    }
    while (true) {
      RawChars& buf = _arena.buffer();
      const auto token =
          ReadEnvelopeToken(std::string_view(buf), _finalBlock, _readerState, _config.acceptTopLevelArray);
      _readerState = token.state;
      switch (token.kind) {
        case EnvelopeToken::Kind::NeedMoreData:
          compact();
          fill(stopToken);
          break;
        case EnvelopeToken::Kind::Pagination: {
          Pagination pagination;
          std::string error;
          if (!ParsePaginationJson(token.value, pagination, error)) {
            throw DecodeError(_readerState.totalBytesConsumed - token.value.size(), "invalid pagination: {}", error);
          }
          if (!_pagination) {
            _pagination = std::move(pagination);
            if (auto cell = _paginationCell.lock()) {
              cell->trySet(*_pagination);
            }
          }
          return token.kind;
        }
        case EnvelopeToken::Kind::Item: {
          _scratch.assign(token.value);
          // the item is fully owned before anything is handed out, release the consumed bytes now
          compact();
          T value{};
          std::string error;
          if (DeserializeFromJson(_scratch, _config.allowUnknownItemFields, value, error)) {
            ++_stats.nbItemsDecoded;
            item.emplace(std::move(value));
          } else {
            ++_stats.nbItemsSkipped;
            log::debug("skipping item ending at offset {}: {}", _readerState.totalBytesConsumed, error);
          }
          return token.kind;
        }
        case EnvelopeToken::Kind::End:
          finalize();
          return token.kind;
        default:
          throw DecodeError(_readerState.totalBytesConsumed, "unexpected tokenizer state");
      }
    }
  }

  // Drops the bytes already tokenized from the arena.
  void compact() {
    _arena->erase_front(_readerState.bytesConsumed);
    _readerState.bytesConsumed = 0;
  }

  // Moves new bytes from the channel to the arena, growing it if it is full.
  void fill(std::stop_token stopToken) {
    RawChars& buf = _arena.buffer();
    if (buf.availableCapacity() == 0) {
      if (_config.maxBufferSize != 0 && buf.capacity() >= _config.maxBufferSize) {
        throw DecodeError(_readerState.totalBytesConsumed, "value exceeds the maximum buffer size of {} bytes",
                          _config.maxBufferSize);
      }
      std::size_t newCapacity = buf.capacity() * 2U;
      if (_config.maxBufferSize != 0) {
        newCapacity = std::min(newCapacity, _config.maxBufferSize);
      }
      log::trace("growing decoding buffer from {} to {} bytes", buf.capacity(), newCapacity);
      buf.reserve(newCapacity);
      updatePeakCapacity();
    }
    const auto [available, isCompleted] = _reader->read(stopToken);
    std::size_t nbBytes = std::min(available.size(), buf.availableCapacity());
    if (_config.readChunkSize != 0) {
      nbBytes = std::min(nbBytes, _config.readChunkSize);
    }
    buf.unchecked_append(available.data(), available.data() + nbBytes);
    _reader->advance(nbBytes);
    _stats.nbBytesConsumed += nbBytes;
    _finalBlock = isCompleted && nbBytes == available.size();
  }

  void finalize() noexcept {
    if (_finished) {
      return;
    }
    _finished = true;
    _arena.release();
    _reader->complete();
    if (!_failure) {
      log::debug("paginated JSON decoding done, {} items decoded, {} skipped, {} bytes", _stats.nbItemsDecoded,
                 _stats.nbItemsSkipped, _stats.nbBytesConsumed);
      if (auto cell = _paginationCell.lock()) {
        cell->trySet(_pagination.value_or(Pagination{}));
      }
    }
  }

  void updatePeakCapacity() noexcept {
    _stats.peakBufferCapacity = std::max(_stats.peakBufferCapacity, _arena->capacity());
  }

  mutable std::timed_mutex _mutex;
  ByteReader* _reader;
  BufferPool* _pool;
  DecoderConfig _config;
  BufferPool::Lease _arena;
  JsonReaderState _readerState;
  std::string _scratch;
  std::deque<T> _pending;
  std::optional<Pagination> _pagination;
  std::weak_ptr<MemoizedPagination> _paginationCell;
  std::exception_ptr _failure;
  DecoderStats _stats;
  bool _finalBlock{false};
  bool _finished{false};
};

// Cursor over the items of a PagedJsonStream.
template <class T>
class PagedJsonCursor final : public ItemCursor<T> {
 public:
  explicit PagedJsonCursor(std::shared_ptr<PagedJsonStream<T>> stream) : _stream(std::move(stream)) {}

  bool next(std::stop_token stopToken) override {
    _current = _stream->nextItem(stopToken);
    return _current.has_value();
  }

  T& current() override { return *_current; }

 private:
  std::shared_ptr<PagedJsonStream<T>> _stream;
  std::optional<T> _current;
};

// Decodes a paginated JSON payload
//   {"pagination": {"PageSize": 5, "CurrentPage": 2, "ContinuationToken": null, "TotalCount": 23}, "items": [...]}
// read from a ByteReader into a PagedSequence of T. T is converted with glaze, so it needs glaze metadata
// (reflection or a glz::meta specialization).
//
// In streaming mode (the default) nothing is read at construction: items are decoded one at a time as they are
// enumerated, and the pagination is parsed as soon as it is met. Requesting the pagination before enumerating
// parses the payload up to the pagination, which is immediate when the producer writes it before the items.
// Items that cannot be converted are skipped (see stats()). The channel is single consumer, so the decoded
// sequence can only be enumerated once, by one of its views.
//
// In buffered mode, the whole payload is read and converted at construction, yielding a repeatable sequence.
//
// The reader is not owned and must outlive the enumeration of the sequence. It is completed once the payload
// has been fully decoded, or on decoding failure.
template <class T>
class PagedJsonDecoder {
 public:
  explicit PagedJsonDecoder(ByteReader& reader, DecoderConfig config = {}, BufferPool& pool = BufferPool::Shared(),
                            std::stop_token stopToken = {})
      : _sequence(PagedSequence<T>::Empty()) {
    config.validate();
    if (config.mode == DecoderConfig::Mode::Buffered) {
      _sequence = decodeBuffered(reader, config, pool, stopToken);
      return;
    }
    _stream = std::make_shared<PagedJsonStream<T>>(reader, config, pool);
    auto pagination = std::make_shared<MemoizedPagination>(
        [stream = _stream](std::stop_token token) { return stream->primePagination(std::move(token)); });
    _stream->setPaginationCell(pagination);
    _sequence = PagedSequence<T>(PagedSequence<T>::SingleUse(std::make_unique<PagedJsonCursor<T>>(_stream)),
                                 std::move(pagination));
  }

  [[nodiscard]] const PagedSequence<T>& sequence() const noexcept { return _sequence; }

  [[nodiscard]] DecoderStats stats() const { return _stream ? _stream->stats() : _bufferedStats; }

 private:
  PagedSequence<T> decodeBuffered(ByteReader& reader, const DecoderConfig& config, BufferPool& pool,
                                  std::stop_token stopToken) {
    auto lease = pool.acquire(config.initialBufferSize);
    RawChars& buf = lease.buffer();
    try {
      while (true) {
        const auto [available, isCompleted] = reader.read(stopToken);
        if (buf.size() + available.size() > config.maxBufferedPayloadBytes) {
          throw DecodeError(buf.size() + available.size(), "payload exceeds {} bytes in buffered mode",
                            config.maxBufferedPayloadBytes);
        }
        buf.append(available);
        reader.advance(available.size());
        if (isCompleted) {
          break;
        }
      }
    } catch (const CancelledError&) {
      throw;
    } catch (const std::exception& ex) {
      log::warn("paginated JSON decoding aborted: {}", ex.what());
      reader.complete();
      throw;
    }
    reader.complete();
    _bufferedStats.nbBytesConsumed = buf.size();
    _bufferedStats.peakBufferCapacity = buf.capacity();

    std::string json(std::string_view(buf).data(), buf.size());
    lease.release();

    try {
      return convertBuffered(json, config);
    } catch (const DecodeError& ex) {
      log::warn("paginated JSON decoding aborted: {}", ex.what());
      throw;
    }
  }

  PagedSequence<T> convertBuffered(const std::string& json, const DecoderConfig& config) {
    std::string error;
    const std::size_t first = SkipJsonWhitespace(json, 0);
    if (first == json.size()) {
      return PagedSequence<T>::FromVector({}, Pagination{});
    }
    if (json[first] == '[' && config.acceptTopLevelArray) {
      std::vector<T> items;
      if (!DeserializeFromJson(json, config.allowUnknownItemFields, items, error)) {
        throw DecodeError(0, "invalid items array: {}", error);
      }
      _bufferedStats.nbItemsDecoded = items.size();
      return PagedSequence<T>::FromVector(std::move(items), Pagination{});
    }
    BufferedEnvelope<T> envelope;
    if (!DeserializeFromJson(json, config.allowUnknownItemFields, envelope, error)) {
      throw DecodeError(0, "invalid paginated envelope: {}", error);
    }
    Pagination pagination;
    if (envelope.pagination) {
      pagination = FromWire(std::move(*envelope.pagination));
    }
    std::vector<T> items;
    if (envelope.items) {
      items = std::move(*envelope.items);
    }
    _bufferedStats.nbItemsDecoded = items.size();
    return PagedSequence<T>::FromVector(std::move(items), std::move(pagination));
  }

  std::shared_ptr<PagedJsonStream<T>> _stream;
  PagedSequence<T> _sequence;
  DecoderStats _bufferedStats;
};

// Shortcut returning the decoded sequence. Decoding statistics are not available through it.
template <class T>
PagedSequence<T> DecodePagedJson(ByteReader& reader, DecoderConfig config = {},
                                 BufferPool& pool = BufferPool::Shared()) {
  return PagedJsonDecoder<T>(reader, std::move(config), pool).sequence();
}

}  // namespace pagedstream
