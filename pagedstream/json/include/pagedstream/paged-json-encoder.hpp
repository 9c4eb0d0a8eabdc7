#pragma once

#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "pagedstream/buffer-pool.hpp"
#include "pagedstream/byte-channel.hpp"
#include "pagedstream/encoder-config.hpp"
#include "pagedstream/errors.hpp"
#include "pagedstream/flush-strategy.hpp"
#include "pagedstream/json-serializer.hpp"
#include "pagedstream/log.hpp"
#include "pagedstream/paged-sequence.hpp"
#include "pagedstream/pagination-json.hpp"
#include "pagedstream/pagination.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

struct EncoderStats {
  std::uint64_t nbItemsWritten{};
  std::uint64_t nbBytesWritten{};
  std::uint32_t nbFlushes{};
};

// Writes a PagedSequence as the paginated JSON envelope
//   {"pagination":{"PageSize":..,"CurrentPage":..,"ContinuationToken":..,"TotalCount":..},"items":[...]}
// The pagination always comes first: it is awaited before any item is read (which materializes the items
// for sequences without pagination source), and flushed right away so that consumers can read it early.
// Items are then serialized one by one, and pushed to the writer according to a FlushStrategy.
// Memory is bounded by the flush threshold plus one item, whatever the number of items.
template <class T>
class PagedJsonEncoder {
 public:
  explicit PagedJsonEncoder(EncoderConfig config = {}, BufferPool& pool = BufferPool::Shared())
      : _config(std::move(config)), _pool(&pool) {
    _config.validate();
  }

  // Encodes one enumeration pass of 'sequence' to 'writer'.
  // Throws PaginationComputationError, ItemConversionError if an item cannot be serialized, ChannelError,
  // CancelledError, and any error of the sequence enumeration. The writer is completed on success only
  // (if configured so).
  EncoderStats encode(const PagedSequence<T>& sequence, ByteWriter& writer, std::stop_token stopToken = {}) {
    EncoderStats stats;
    auto lease = _pool->acquire(_config.itemBufferInitialCapacity);
    RawChars& out = lease.buffer();
    std::string scratch;

    const Pagination pagination = sequence.pagination(stopToken);
    out.append(std::string_view(R"({"pagination":)"));
    AppendPaginationJson(pagination, scratch, out);
    out.append(std::string_view(R"(,"items":[)"));
    push(writer, out, stats, stopToken);

    FlushStrategy flushStrategy(pagination.totalCount, _config.bytesPendingThreshold);
    auto enumerator = sequence.enumerate(stopToken);
    while (enumerator.advance()) {
      const auto sizeBefore = out.size();
      if (stats.nbItemsWritten != 0) {
        out.push_back(',');
      }
      if (!AppendJson(enumerator.current(), scratch, out)) {
        throw ItemConversionError("unable to serialize item #{}", stats.nbItemsWritten + 1U);
      }
      ++stats.nbItemsWritten;
      if (flushStrategy.onItem(out.size() - sizeBefore) || _config.flushEveryItem) {
        push(writer, out, stats, stopToken);
      }
    }
    out.append(std::string_view("]}"));
    push(writer, out, stats, stopToken);

    if (_config.completeWriter) {
      writer.complete();
    }
    log::debug("paginated JSON encoded, {} items, {} bytes, {} flushes", stats.nbItemsWritten, stats.nbBytesWritten,
               stats.nbFlushes);
    return stats;
  }

  [[nodiscard]] const EncoderConfig& config() const noexcept { return _config; }

 private:
  // Writes and flushes the pending bytes.
  static void push(ByteWriter& writer, RawChars& out, EncoderStats& stats, std::stop_token stopToken) {
    writer.write(std::string_view(out), stopToken);
    writer.flush(stopToken);
    stats.nbBytesWritten += out.size();
    ++stats.nbFlushes;
    log::debug("flushed {} bytes", out.size());
    out.clear();
  }

  EncoderConfig _config;
  BufferPool* _pool;
};

template <class T>
EncoderStats EncodePagedJson(const PagedSequence<T>& sequence, ByteWriter& writer, EncoderConfig config = {},
                             std::stop_token stopToken = {}) {
  return PagedJsonEncoder<T>(std::move(config)).encode(sequence, writer, std::move(stopToken));
}

}  // namespace pagedstream
