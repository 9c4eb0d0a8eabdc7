#include "pagedstream/encoder-config.hpp"

#include <cstddef>

#include "pagedstream/invalid_argument_exception.hpp"

namespace pagedstream {

void EncoderConfig::validate() const {
  if (bytesPendingThreshold == 0) {
    throw invalid_argument("bytesPendingThreshold must be > 0");
  }
}

EncoderConfig& EncoderConfig::withItemBufferInitialCapacity(std::size_t bytes) {
  itemBufferInitialCapacity = bytes;
  return *this;
}

EncoderConfig& EncoderConfig::withBytesPendingThreshold(std::size_t bytes) {
  bytesPendingThreshold = bytes;
  return *this;
}

EncoderConfig& EncoderConfig::withFlushEveryItem(bool on) {
  flushEveryItem = on;
  return *this;
}

EncoderConfig& EncoderConfig::withCompleteWriter(bool on) {
  completeWriter = on;
  return *this;
}

}  // namespace pagedstream
