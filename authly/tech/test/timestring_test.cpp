#include "authly/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "authly/timedef.hpp"

namespace authly {

TEST(TimeString, Epoch) { EXPECT_EQ(TimeToStringISO8601UTC(SysTimePoint{}), "1970-01-01T00:00:00Z"); }

TEST(TimeString, LeapDay) {
  EXPECT_EQ(TimeToStringISO8601UTC(SysClock::from_time_t(1709208000)), "2024-02-29T12:00:00Z");
}

TEST(TimeString, SubSecondsAreTruncated) {
  const auto tp = SysClock::from_time_t(1709208000) + std::chrono::milliseconds{999};
  EXPECT_EQ(TimeToStringISO8601UTC(tp), "2024-02-29T12:00:00Z");
}

}  // namespace authly
