#include "pagedstream/flush-strategy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pagedstream {

std::uint32_t FlushStrategy::ItemsPerFlush(std::optional<std::int32_t> totalCount) noexcept {
  if (!totalCount) {
    return 100;
  }
  if (*totalCount < 1000) {
    return 200;
  }
  if (*totalCount < 10000) {
    return 100;
  }
  if (*totalCount < 100000) {
    return 50;
  }
  return 25;
}

bool FlushStrategy::onItem(std::size_t nbBytes) noexcept {
  ++_pendingItems;
  _pendingBytes += nbBytes;
  if (_pendingItems >= _itemsPerFlush || _pendingBytes > _bytesPendingThreshold) {
    _pendingItems = 0;
    _pendingBytes = 0;
    return true;
  }
  return false;
}

}  // namespace pagedstream
