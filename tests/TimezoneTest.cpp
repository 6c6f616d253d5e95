#include <chrono> // std::chrono::{sys_days, year_month_day, hours}

#include <Nimbus++/Core/Coordinates.hpp>
#include <Nimbus++/Core/Timezone.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using namespace std::chrono;
using nimbus::core::Coordinates;
using nimbus::utils::clock::TimePoint;

namespace tz = nimbus::core::timezone;

namespace {
  fn At(const f64 latitude, const f64 longitude) -> Coordinates {
    return *Coordinates::Create(latitude, longitude);
  }

  // 2026-10-19 22:30 UTC
  const TimePoint LATE_EVENING = sys_days(year(2026) / October / 19) + hours(22) + minutes(30);
} // namespace

class TimezoneTest : public testing::Test {};

TEST_F(TimezoneTest, OffsetFollowsLongitude) {
  EXPECT_EQ(tz::ApproximateUtcOffset(At(51.4769, 0.0)), hours(0));
  EXPECT_EQ(tz::ApproximateUtcOffset(At(35.6762, 139.6917)), hours(9));
  EXPECT_EQ(tz::ApproximateUtcOffset(At(40.7128, -74.006)), hours(-5));
}

TEST_F(TimezoneTest, OffsetAtTheDateLine) {
  EXPECT_EQ(tz::ApproximateUtcOffset(At(0.0, 180.0)), hours(12));
  EXPECT_EQ(tz::ApproximateUtcOffset(At(0.0, -180.0)), hours(-12));
}

TEST_F(TimezoneTest, LocalDateCanBeAheadOfUtc) {
  // Tokyo is already on the 20th.
  EXPECT_EQ(tz::LocalDate(At(35.6762, 139.6917), LATE_EVENING), year(2026) / October / 20);
  EXPECT_EQ(tz::LocalDate(At(51.5074, -0.1278), LATE_EVENING), year(2026) / October / 19);
}

TEST_F(TimezoneTest, TomorrowDependsOnLocation) {
  EXPECT_EQ(tz::Tomorrow(At(35.6762, 139.6917), LATE_EVENING), year(2026) / October / 21);
  EXPECT_EQ(tz::Tomorrow(At(40.7128, -74.006), LATE_EVENING), year(2026) / October / 20);
}

TEST_F(TimezoneTest, TomorrowCrossesMonthAndYear) {
  const TimePoint newYearsEve = sys_days(year(2026) / December / 31) + hours(12);

  EXPECT_EQ(tz::Tomorrow(At(0.0, 0.0), newYearsEve), year(2027) / January / 1);
}

TEST_F(TimezoneTest, IsTomorrowMatchesOnlyTheNextDay) {
  const Coordinates london = At(51.5074, -0.1278);

  EXPECT_TRUE(tz::IsTomorrow(london, year(2026) / October / 20, LATE_EVENING));
  EXPECT_FALSE(tz::IsTomorrow(london, year(2026) / October / 19, LATE_EVENING));
  EXPECT_FALSE(tz::IsTomorrow(london, year(2026) / October / 21, LATE_EVENING));
}
