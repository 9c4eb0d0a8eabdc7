#include "pagedstream/buffer-pool.hpp"

#include <cstddef>
#include <mutex>
#include <utility>

#include "pagedstream/log.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

void BufferPool::Lease::release() noexcept {
  if (_pool != nullptr) {
    std::exchange(_pool, nullptr)->giveBack(std::move(_buf));
    _buf = RawChars{};
  }
}

BufferPool::BufferPool(std::size_t maxRetainedBuffers) : _maxRetainedBuffers(maxRetainedBuffers) {
  // reserved up-front so that giving back a buffer never allocates
  _free.reserve(static_cast<decltype(_free)::size_type>(maxRetainedBuffers));
}

BufferPool::Lease BufferPool::acquire(std::size_t minCapacity) {
  RawChars buf;
  {
    std::scoped_lock lock(_mutex);
    // pick the most recently returned buffer, it is the most likely to be hot in cache
    if (!_free.empty()) {
      buf = std::move(_free.back());
      _free.pop_back();
    }
  }
  buf.clear();
  buf.reserve(minCapacity);
  return {this, std::move(buf)};
}

std::size_t BufferPool::nbRetainedBuffers() const {
  std::scoped_lock lock(_mutex);
  return _free.size();
}

BufferPool& BufferPool::Shared() {
  static BufferPool gPool;
  return gPool;
}

void BufferPool::giveBack(RawChars&& buf) noexcept {
  if (buf.capacity() == 0) {
    return;
  }
  std::scoped_lock lock(_mutex);
  if (_free.size() < _maxRetainedBuffers) {
    _free.push_back(std::move(buf));
  } else {
    log::trace("BufferPool full, dropping buffer of capacity {}", buf.capacity());
  }
}

}  // namespace pagedstream
