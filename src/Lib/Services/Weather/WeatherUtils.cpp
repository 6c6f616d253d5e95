#include "WeatherUtils.hpp"

#include <algorithm> // std::{clamp, min, max, ranges::{count, find_if, sort}}
#include <chrono>    // std::chrono::{seconds, sys_seconds, year_month_day}
#include <iterator>  // std::prev

#include "Nimbus++/Core/Timezone.hpp"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using nimbus::core::DailyForecast;
using nimbus::core::Temperature;
using nimbus::services::weather::dto::owm::Condition;
using nimbus::services::weather::dto::owm::ForecastItem;

namespace {
  constexpr u32 SLOTS_PER_DAY      = 8;  // one slot every three hours
  constexpr u32 MAX_FORECAST_SLOTS = 40; // five days on the free tier

  struct DayBucket {
    std::chrono::year_month_day date;
    Vec<const ForecastItem*>    slots;
  };
} // namespace

namespace nimbus::services::weather::helpers {
  fn ForecastSlotCount(const u32 days) -> u32 {
    // Clamped before multiplying so a huge day count cannot wrap.
    return std::clamp(days, 1U, MAX_FORECAST_SLOTS / SLOTS_PER_DAY) * SLOTS_PER_DAY;
  }

  fn MostFrequent(const Span<const String> values) -> String {
    if (values.empty())
      return {};

    const String* best      = values.data();
    usize         bestCount = 0;

    for (const String& candidate : values) {
      const auto count = static_cast<usize>(std::ranges::count(values, candidate));

      // Strictly greater keeps the earliest value on a tie.
      if (count > bestCount) {
        best      = &candidate;
        bestCount = count;
      }
    }

    return *best;
  }

  fn FirstDescription(const Vec<Condition>& conditions) -> String {
    if (conditions.empty() || conditions.front().description.empty())
      return "unknown";

    return conditions.front().description;
  }

  fn AggregateDailyForecasts(const Span<const ForecastItem> items, const Coordinates& coordinates, const u32 days) -> Result<Vec<DailyForecast>> {
    Vec<DayBucket> buckets;

    for (const ForecastItem& item : items) {
      const std::chrono::sys_seconds instant { std::chrono::seconds(item.dt) };
      const auto                     date = core::timezone::LocalDate(coordinates, instant);

      auto bucket = std::ranges::find_if(buckets, [&](const DayBucket& existing) { return existing.date == date; });

      if (bucket == buckets.end()) {
        if (buckets.size() >= days)
          continue;

        buckets.push_back({ .date = date, .slots = {} });
        bucket = std::prev(buckets.end());
      }

      bucket->slots.push_back(&item);
    }

    Vec<DailyForecast> forecasts;
    forecasts.reserve(buckets.size());

    for (const DayBucket& bucket : buckets) {
      f64         low          = bucket.slots.front()->main.tempMin;
      f64         high         = bucket.slots.front()->main.tempMax;
      f64         humiditySum  = 0.0;
      f64         windSum      = 0.0;
      Vec<String> descriptions;

      for (const ForecastItem* slot : bucket.slots) {
        low  = std::min(low, slot->main.tempMin);
        high = std::max(high, slot->main.tempMax);

        humiditySum += slot->main.humidity;
        windSum += slot->wind.speed;

        descriptions.push_back(FirstDescription(slot->weather));
      }

      Result<Temperature> minTemp = Temperature::FromCelsius(low);
      if (!minTemp)
        return Err(minTemp.error());

      Result<Temperature> maxTemp = Temperature::FromCelsius(high);
      if (!maxTemp)
        return Err(maxTemp.error());

      const auto slotCount = static_cast<f64>(bucket.slots.size());

      forecasts.push_back({
        .date           = bucket.date,
        .temperatureMin = *minTemp,
        .temperatureMax = *maxTemp,
        .description    = MostFrequent(descriptions),
        .humidity       = humiditySum / slotCount,
        .windSpeed      = windSum / slotCount,
        .pressure       = bucket.slots.front()->main.pressure,
      });
    }

    std::ranges::sort(forecasts, {}, [](const DailyForecast& forecast) { return std::chrono::sys_days(forecast.date); });

    return forecasts;
  }
} // namespace nimbus::services::weather::helpers
