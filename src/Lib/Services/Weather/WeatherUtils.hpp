#pragma once

#include "Nimbus++/Core/Coordinates.hpp"
#include "Nimbus++/Core/Entities.hpp"
#include "Nimbus++/Utils/Types.hpp"

#include "DataTransferObjects.hpp"

namespace nimbus::services::weather::helpers {
  namespace {
    using nimbus::utils::types::Result;
    using nimbus::utils::types::Span;
    using nimbus::utils::types::String;
    using nimbus::utils::types::u32;
    using nimbus::utils::types::Vec;
  } // namespace

  /**
   * @brief Three-hour slots to request for @p days days, between one day and the free tier's five.
   */
  fn ForecastSlotCount(u32 days) -> u32;

  /**
   * @brief Collapses three-hour forecast slots into local calendar days.
   *
   * Slots are bucketed by their approximate local date at @p coordinates and
   * each bucket becomes one DailyForecast:
   *  - temperatureMin/Max: lowest temp_min and highest temp_max
   *  - humidity, windSpeed: arithmetic mean
   *  - pressure: taken from the first slot of the day
   *  - description: most frequent, earliest wins on a tie
   *
   * @param items Slots in ascending time order.
   * @param coordinates Position used to derive the local date.
   * @param days Keeps only the first @p days days.
   * @return Days in ascending order, or an error if a slot carries an impossible temperature.
   */
  fn AggregateDailyForecasts(Span<const dto::owm::ForecastItem> items, const core::Coordinates& coordinates, u32 days) -> Result<Vec<core::DailyForecast>>;

  /**
   * @brief Most frequent string in @p values; the earliest one wins ties. Empty input gives "".
   */
  fn MostFrequent(Span<const String> values) -> String;

  /**
   * @brief First condition description, or "unknown" if the provider sent none.
   */
  fn FirstDescription(const Vec<dto::owm::Condition>& conditions) -> String;
} // namespace nimbus::services::weather::helpers
