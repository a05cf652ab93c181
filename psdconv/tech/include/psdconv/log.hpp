#pragma once

// Logging abstraction over spdlog.
// Header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY as a public compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <string_view>

namespace psdconv {

namespace log = spdlog;

// Parses a textual log level (trace, debug, info, warn, error, critical, off).
// Throws std::invalid_argument for unknown names.
log::level::level_enum LogLevelFromString(std::string_view levelName);

}  // namespace psdconv
