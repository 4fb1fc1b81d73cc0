#pragma once

#include <string>

#include "authly/timedef.hpp"

namespace authly {

/// Returns the representation of given time point in ISO 8601 UTC format, with second precision:
///   - 'YYYY-MM-DDTHH:MM:SSZ'
std::string TimeToStringISO8601UTC(SysTimePoint timePoint);

}  // namespace authly
