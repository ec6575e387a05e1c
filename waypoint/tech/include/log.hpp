#pragma once

// Logging facade. Header-only spdlog usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition, so consumers remain free to link the compiled spdlog library.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace waypoint {

namespace log = spdlog;

}  // namespace waypoint
