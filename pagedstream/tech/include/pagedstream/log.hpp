#pragma once

// Logging is delegated to spdlog (its compiled library or header-only mode, depending on
// how the installed package was configured).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace pagedstream {

namespace log = spdlog;

}  // namespace pagedstream
