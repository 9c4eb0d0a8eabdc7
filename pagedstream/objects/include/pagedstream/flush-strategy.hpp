#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pagedstream {

// Decides when a streaming encoder flushes its writer.
// Small collections are flushed rarely, large ones more often so that the consumer can start
// decoding early, and in any case as soon as too many bytes are pending.
class FlushStrategy {
 public:
  FlushStrategy(std::optional<std::int32_t> totalCount, std::size_t bytesPendingThreshold) noexcept
      : _itemsPerFlush(ItemsPerFlush(totalCount)), _bytesPendingThreshold(bytesPendingThreshold) {}

  // Number of items written between two flushes, depending on the expected total number of items.
  static std::uint32_t ItemsPerFlush(std::optional<std::int32_t> totalCount) noexcept;

  [[nodiscard]] std::uint32_t itemsPerFlush() const noexcept { return _itemsPerFlush; }

  // Accounts one more item of 'nbBytes' bytes and tells whether the writer should be flushed now.
  // The counters are reset when it returns true.
  [[nodiscard]] bool onItem(std::size_t nbBytes) noexcept;

  [[nodiscard]] std::size_t nbPendingBytes() const noexcept { return _pendingBytes; }

 private:
  std::uint32_t _itemsPerFlush;
  std::uint32_t _pendingItems{};
  std::size_t _bytesPendingThreshold;
  std::size_t _pendingBytes{};
};

}  // namespace pagedstream
