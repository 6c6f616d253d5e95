#pragma once

#include <chrono>                // std::chrono::year_month_day
#include <glaze/core/common.hpp> // glz::object
#include <glaze/core/meta.hpp>   // glz::meta

#include "../Utils/Clock.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

#include "Coordinates.hpp"
#include "Temperature.hpp"

namespace nimbus::core {
  namespace {
    using utils::types::f64;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct Location
   * @brief A named place. The id is always the "lat,lon" string of its coordinates.
   */
  struct Location {
    String      id;          ///< "lat,lon"; doubles as the location cache key.
    String      name;        ///< Place name as reported by the provider.
    String      country;     ///< Country code or name.
    Coordinates coordinates; ///< Validated position.

    /**
     * @brief Builds a location, rejecting blank names or countries.
     */
    static fn Create(const Coordinates& coordinates, String name, String country) -> Result<Location>;

    /**
     * @brief A placeholder location for positions the provider knows nothing about.
     *
     * Name is the coordinate string and country is "Unknown".
     */
    static fn Unnamed(const Coordinates& coordinates) -> Location;

    fn operator==(const Location&) const -> bool = default;
  };

  /**
   * @struct WeatherData
   * @brief Current conditions at a location.
   */
  struct WeatherData {
    Location                location;
    utils::clock::TimePoint timestamp;
    Temperature             temperature;
    String                  description;
    f64                     humidity  = 0.0; ///< Percent, 0-100.
    f64                     windSpeed = 0.0; ///< m/s, never negative.
    f64                     pressure  = 0.0; ///< hPa, always positive.

    /**
     * @brief Checks the field domains listed above.
     */
    [[nodiscard]] fn validate() const -> Result<>;
  };

  /**
   * @struct DailyForecast
   * @brief One local calendar day of a forecast.
   */
  struct DailyForecast {
    std::chrono::year_month_day date;
    Temperature                 temperatureMin;
    Temperature                 temperatureMax;
    String                      description;
    f64                         humidity  = 0.0;
    f64                         windSpeed = 0.0;
    f64                         pressure  = 0.0;
  };

  /**
   * @struct WeatherForecast
   * @brief Multi-day forecast, days in ascending date order.
   */
  struct WeatherForecast {
    Location           location;
    Vec<DailyForecast> forecasts;
  };

  /**
   * @struct LocationSummary
   * @brief One row of a "warmer than X tomorrow" answer.
   */
  struct LocationSummary {
    String locationId;
    String locationName;
    String country;
    f64    tomorrowMaxTemperature = 0.0; ///< Expressed in temperatureUnit.
    String temperatureUnit;              ///< "celsius" or "fahrenheit".
    String weatherDescription;
  };

  /**
   * @struct LocationWeatherDetails
   * @brief A location together with its multi-day forecast.
   */
  struct LocationWeatherDetails {
    Location        location;
    WeatherForecast forecast;
  };
} // namespace nimbus::core

template <>
struct glz::meta<nimbus::core::LocationSummary> {
  using T = nimbus::core::LocationSummary;

  // clang-format off
  static constexpr auto value = object(
    "locationId",             &T::locationId,
    "locationName",           &T::locationName,
    "country",                &T::country,
    "tomorrowMaxTemperature", &T::tomorrowMaxTemperature,
    "temperatureUnit",        &T::temperatureUnit,
    "weatherDescription",     &T::weatherDescription
  );
  // clang-format on
};
