#pragma once

#include <cstdint>

namespace pagedstream {

// What happens to a failed pagination computation.
enum class PaginationMemoPolicy : std::uint8_t {
  // The failure is memoized: every later call rethrows it, the closure is never invoked again.
  CacheFailure,
  // The failure is reported to the callers awaiting that computation, then forgotten:
  // the next call invokes the closure again.
  RetryAfterFailure,
};

}  // namespace pagedstream
