#include "pagedstream/decoder-config.hpp"

#include <cstddef>

#include "pagedstream/invalid_argument_exception.hpp"

namespace pagedstream {

void DecoderConfig::validate() const {
  if (initialBufferSize == 0) {
    throw invalid_argument("initialBufferSize must be > 0");
  }
  if (maxBufferSize != 0 && maxBufferSize < initialBufferSize) {
    throw invalid_argument("maxBufferSize must be >= initialBufferSize");
  }
  if (mode == Mode::Buffered && maxBufferedPayloadBytes == 0) {
    throw invalid_argument("maxBufferedPayloadBytes must be > 0 in buffered mode");
  }
}

DecoderConfig& DecoderConfig::withInitialBufferSize(std::size_t bytes) {
  initialBufferSize = bytes;
  return *this;
}

DecoderConfig& DecoderConfig::withMaxBufferSize(std::size_t bytes) {
  maxBufferSize = bytes;
  return *this;
}

DecoderConfig& DecoderConfig::withReadChunkSize(std::size_t bytes) {
  readChunkSize = bytes;
  return *this;
}

DecoderConfig& DecoderConfig::withTopLevelArray(bool on) {
  acceptTopLevelArray = on;
  return *this;
}

DecoderConfig& DecoderConfig::withUnknownItemFields(bool allow) {
  allowUnknownItemFields = allow;
  return *this;
}

DecoderConfig& DecoderConfig::withMode(Mode mode) {
  this->mode = mode;
  return *this;
}

DecoderConfig& DecoderConfig::withMaxBufferedPayloadBytes(std::size_t bytes) {
  maxBufferedPayloadBytes = bytes;
  return *this;
}

}  // namespace pagedstream
