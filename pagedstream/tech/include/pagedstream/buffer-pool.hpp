#pragma once

#include <cstddef>
#include <mutex>
#include <utility>

#include "pagedstream/raw-chars.hpp"
#include "pagedstream/vector.hpp"

namespace pagedstream {

// BufferPool caches RawChars arenas for reuse across decoding / encoding passes.
// Buffers are handed out through a Lease that returns them to the pool on destruction, so that
// every exit path of a pass (normal end, error, cancellation) releases its buffer.
// Thread safe.
class BufferPool {
 public:
  static constexpr std::size_t kDefaultMaxRetainedBuffers = 16;

  class Lease {
   public:
    Lease() noexcept = default;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& rhs) noexcept : _pool(std::exchange(rhs._pool, nullptr)), _buf(std::move(rhs._buf)) {}
    Lease& operator=(Lease&& rhs) noexcept {
      if (this != &rhs) {
        release();
        _pool = std::exchange(rhs._pool, nullptr);
        _buf = std::move(rhs._buf);
      }
      return *this;
    }

    ~Lease() { release(); }

    [[nodiscard]] RawChars& buffer() noexcept { return _buf; }
    [[nodiscard]] const RawChars& buffer() const noexcept { return _buf; }

    RawChars* operator->() noexcept { return &_buf; }
    const RawChars* operator->() const noexcept { return &_buf; }

    // Whether this lease still holds a buffer of its pool.
    [[nodiscard]] bool active() const noexcept { return _pool != nullptr; }

    // Gives the buffer back to its pool immediately. Idempotent.
    void release() noexcept;

   private:
    friend class BufferPool;

    Lease(BufferPool* pool, RawChars buf) noexcept : _pool(pool), _buf(std::move(buf)) {}

    BufferPool* _pool{nullptr};
    RawChars _buf;
  };

  explicit BufferPool(std::size_t maxRetainedBuffers = kDefaultMaxRetainedBuffers);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  ~BufferPool() = default;

  // Returns an empty buffer whose capacity is at least minCapacity.
  [[nodiscard]] Lease acquire(std::size_t minCapacity);

  // Number of buffers currently cached in the pool.
  [[nodiscard]] std::size_t nbRetainedBuffers() const;

  // Process-wide pool used by default by the JSON decoder and encoder.
  static BufferPool& Shared();

 private:
  void giveBack(RawChars&& buf) noexcept;

  mutable std::mutex _mutex;
  vector<RawChars> _free;
  std::size_t _maxRetainedBuffers;
};

}  // namespace pagedstream
