#include "pagedstream/memory-channel.hpp"

#include <algorithm>
#include <cstddef>
#include <stop_token>
#include <string_view>

#include "pagedstream/errors.hpp"
#include "pagedstream/invalid_argument_exception.hpp"

namespace pagedstream {

ByteReader::ReadResult MemoryByteReader::read(std::stop_token stopToken) {
  if (stopToken.stop_requested()) {
    throw CancelledError();
  }
  ++_nbReads;
  _exposed = std::min(_payload.size(), _exposed + _chunkSize);
  return {_payload.substr(_consumed, _exposed - _consumed), _exposed == _payload.size()};
}

void MemoryByteReader::advance(std::size_t consumed) {
  if (consumed > _exposed - _consumed) {
    throw invalid_argument("cannot advance by {} bytes, only {} bytes are available", consumed, _exposed - _consumed);
  }
  _consumed += consumed;
}

void StringByteWriter::write(std::string_view data, std::stop_token stopToken) {
  if (stopToken.stop_requested()) {
    throw CancelledError();
  }
  if (_completed) {
    throw ChannelError(0, "write of {} bytes after completion", data.size());
  }
  ++_nbWrites;
  _out.append(data);
}

void StringByteWriter::flush(std::stop_token stopToken) {
  if (stopToken.stop_requested()) {
    throw CancelledError();
  }
  ++_nbFlushes;
  _flushedSize = _out.size();
}

void StringByteWriter::complete() {
  _flushedSize = _out.size();
  _completed = true;
}

}  // namespace pagedstream
