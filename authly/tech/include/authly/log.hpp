#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace authly {

namespace log = spdlog;

// Apply the level named by the AUTHLY_LOG_LEVEL environment variable ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names are reported and ignored. Returns true if the level was changed.
bool SetLogLevelFromEnv();

}  // namespace authly
