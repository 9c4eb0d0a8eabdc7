#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "pagedstream/internal/raw-bytes-base.hpp"

namespace pagedstream {

// Character arena used for JSON payload bytes.
using RawChars = RawBytesBase<char, std::string_view, std::size_t>;

// A smaller version of RawChars using 32-bit size type, limited to 4 GiB.
using RawChars32 = RawBytesBase<char, std::string_view, std::uint32_t>;

}  // namespace pagedstream
