/**
 * @file Timezone.hpp
 * @brief Longitude-based local date approximation.
 *
 * The UTC offset is estimated as round(longitude / 15) hours, clamped to
 * [-12, +14]. This ignores political boundaries and daylight saving time, so
 * near a zone edge the local date can be off by one for part of the day.
 */

#pragma once

#include <chrono> // std::chrono::{hours, year_month_day}

#include "../Utils/Clock.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Types.hpp"

#include "Coordinates.hpp"

namespace nimbus::core::timezone {
  inline constexpr utils::types::i32 MIN_OFFSET_HOURS = -12;
  inline constexpr utils::types::i32 MAX_OFFSET_HOURS = 14;

  /**
   * @brief Estimated UTC offset for a position.
   */
  fn ApproximateUtcOffset(const Coordinates& coordinates) -> std::chrono::hours;

  /**
   * @brief Local calendar date at @p coordinates for the UTC instant @p instant.
   */
  fn LocalDate(const Coordinates& coordinates, utils::clock::TimePoint instant) -> std::chrono::year_month_day;

  /**
   * @brief Today's local date at @p coordinates.
   */
  fn Today(const Coordinates& coordinates, utils::clock::TimePoint nowUtc) -> std::chrono::year_month_day;

  /**
   * @brief Tomorrow's local date at @p coordinates.
   */
  fn Tomorrow(const Coordinates& coordinates, utils::clock::TimePoint nowUtc) -> std::chrono::year_month_day;

  fn IsTomorrow(const Coordinates& coordinates, const std::chrono::year_month_day& date, utils::clock::TimePoint nowUtc) -> bool;
} // namespace nimbus::core::timezone
