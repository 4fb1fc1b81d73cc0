#pragma once

#include <chrono>

namespace authly {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time, which
/// certificate validity windows are expressed in.
/// It is not monotonic - deadlines and durations use steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace authly
