#include "Nimbus++/Core/Timezone.hpp"

#include <algorithm> // std::clamp
#include <cmath>     // std::lround

using namespace nimbus::utils::types;
using nimbus::utils::clock::TimePoint;

namespace nimbus::core::timezone {
  fn ApproximateUtcOffset(const Coordinates& coordinates) -> std::chrono::hours {
    const auto rounded = static_cast<i32>(std::lround(coordinates.longitude() / 15.0));

    return std::chrono::hours(std::clamp(rounded, MIN_OFFSET_HOURS, MAX_OFFSET_HOURS));
  }

  fn LocalDate(const Coordinates& coordinates, const TimePoint instant) -> std::chrono::year_month_day {
    using std::chrono::days, std::chrono::floor, std::chrono::sys_days;

    const sys_days localDay = floor<days>(instant + ApproximateUtcOffset(coordinates));

    return std::chrono::year_month_day(localDay);
  }

  fn Today(const Coordinates& coordinates, const TimePoint nowUtc) -> std::chrono::year_month_day {
    return LocalDate(coordinates, nowUtc);
  }

  fn Tomorrow(const Coordinates& coordinates, const TimePoint nowUtc) -> std::chrono::year_month_day {
    return std::chrono::year_month_day(std::chrono::sys_days(Today(coordinates, nowUtc)) + std::chrono::days(1));
  }

  fn IsTomorrow(const Coordinates& coordinates, const std::chrono::year_month_day& date, const TimePoint nowUtc) -> bool {
    return date == Tomorrow(coordinates, nowUtc);
  }
} // namespace nimbus::core::timezone
