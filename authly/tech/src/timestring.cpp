#include "authly/timestring.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <string>

#include "authly/timedef.hpp"

namespace authly {

std::string TimeToStringISO8601UTC(SysTimePoint timePoint) {
  // time_point formatting of fmt uses the local time zone
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(SysClock::to_time_t(timePoint)));
}

}  // namespace authly
