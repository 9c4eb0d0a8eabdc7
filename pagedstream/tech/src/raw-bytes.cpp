#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <string_view>
#include <utility>

#include "pagedstream/internal/raw-bytes-base.hpp"
#include "pagedstream/safe-cast.hpp"

namespace pagedstream {

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(size_type capacity)
    : _buf(static_cast<value_type *>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(ViewType data) : RawBytesBase(SafeCast<size_type>(data.size())) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), _capacity);
    _size = _capacity;
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(const RawBytesBase &rhs) : RawBytesBase(rhs.capacity()) {
  _size = rhs.size();
  if (!empty()) {
    std::memcpy(_buf, rhs.data(), _size);
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(RawBytesBase &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType> &RawBytesBase<T, ViewType, SizeType>::operator=(RawBytesBase &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType> &RawBytesBase<T, ViewType, SizeType>::operator=(const RawBytesBase &rhs) {
  if (this != &rhs) {
    reserve(rhs.size());
    _size = rhs.size();
    if (!empty()) {
      std::memcpy(_buf, rhs.data(), _size);
    }
  }
  return *this;
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::~RawBytesBase() {
  std::free(_buf);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::unchecked_append(const_pointer first, const_pointer last) {
  if (first != last) {
    const auto sz = static_cast<std::size_t>(last - first);
    std::memcpy(_buf + _size, first, sz);
    _size += static_cast<size_type>(sz);
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::append(const_pointer first, const_pointer last) {
  assert(first <= last);
  ensureAvailableCapacityExponential(SafeCast<size_type>(last - first));
  unchecked_append(first, last);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::push_back(value_type byte) {
  ensureAvailableCapacityExponential(1U);
  _buf[_size++] = byte;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::assign(ViewType data) {
  const auto sz = SafeCast<size_type>(data.size());
  reserveExponential(sz);
  if (sz != 0) {
    std::memcpy(_buf, data.data(), sz);
  }
  _size = sz;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::erase_front(size_type n) {
  assert(n <= _size);
  if (n == _size) {
    _size = 0;
  } else if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::reserveExponential(size_type newCapacity) {
  if (_capacity < newCapacity) {
    if constexpr (sizeof(uintmax_t) > sizeof(size_type)) {
      // prevent overflow when doubling capacity
      static constexpr uintmax_t kMaxCapacity = static_cast<uintmax_t>(std::numeric_limits<size_type>::max());
      if ((static_cast<uintmax_t>(_capacity) * 2UL) + 1UL > kMaxCapacity) {
        throw std::bad_alloc();
      }
    }
    const auto doubledCapacity = static_cast<size_type>((_capacity * size_type{2}) + size_type{1});
    if (newCapacity < doubledCapacity) {
      newCapacity = doubledCapacity;
    }
    reallocUp(newCapacity);
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::ensureAvailableCapacityExponential(size_type availableCapacity) {
  if constexpr (sizeof(size_type) < sizeof(uintmax_t)) {
    static constexpr uintmax_t kMaxCapacity = static_cast<uintmax_t>(std::numeric_limits<size_type>::max());
    if (kMaxCapacity < static_cast<uintmax_t>(_size) + availableCapacity) {
      throw std::bad_alloc();
    }
  }
  reserveExponential(_size + availableCapacity);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::shrinkToZero() noexcept {
  std::free(_buf);
  _buf = nullptr;
  _size = 0;
  _capacity = 0;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::swap(RawBytesBase &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

template <class T, class ViewType, class SizeType>
bool RawBytesBase<T, ViewType, SizeType>::operator==(const RawBytesBase &rhs) const noexcept {
  if (size() != rhs.size()) {
    return false;
  }
  const auto *lhsData = data();
  const auto *rhsData = rhs.data();
  if (lhsData != nullptr && rhsData != nullptr) {
    // memcmp with nullptr is undefined behavior even if size is zero
    return std::memcmp(lhsData, rhsData, size()) == 0;
  }
  return true;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

template class RawBytesBase<char, std::string_view, std::size_t>;
template class RawBytesBase<char, std::string_view, std::uint32_t>;

}  // namespace pagedstream
