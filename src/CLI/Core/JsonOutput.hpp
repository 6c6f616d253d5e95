#pragma once

#include <glaze/core/common.hpp> // glz::object
#include <glaze/core/meta.hpp>   // glz::meta

#include <Nimbus++/Core/Entities.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::cli {
  namespace {
    using core::LocationSummary;
    using core::LocationWeatherDetails;

    using utils::types::f64;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  struct LocationJson {
    String id;
    String name;
    String country;
    f64    latitude  = 0.0;
    f64    longitude = 0.0;
  };

  /**
   * @brief A forecast day with its date as "YYYY-MM-DD" and temperatures in Celsius.
   */
  struct ForecastDayJson {
    String date;
    f64    minCelsius = 0.0;
    f64    maxCelsius = 0.0;
    String description;
    f64    humidity  = 0.0;
    f64    windSpeed = 0.0;
    f64    pressure  = 0.0;
  };

  struct DetailsJson {
    LocationJson         location;
    Vec<ForecastDayJson> forecast;
  };

  fn ToDetailsJson(const LocationWeatherDetails& details) -> DetailsJson;

  /**
   * @brief Serializes a summary answer.
   * @param pretty Indent the output.
   */
  fn WriteSummaryJson(const Vec<LocationSummary>& summaries, bool pretty) -> Result<String>;

  fn WriteDetailsJson(const LocationWeatherDetails& details, bool pretty) -> Result<String>;
} // namespace nimbus::cli

namespace glz {
  template <>
  struct meta<nimbus::cli::LocationJson> {
    using T = nimbus::cli::LocationJson;

    static constexpr auto value = object("id", &T::id, "name", &T::name, "country", &T::country, "latitude", &T::latitude, "longitude", &T::longitude);
  };

  template <>
  struct meta<nimbus::cli::ForecastDayJson> {
    using T = nimbus::cli::ForecastDayJson;

    // clang-format off
    static constexpr auto value = object(
      "date",        &T::date,
      "minCelsius",  &T::minCelsius,
      "maxCelsius",  &T::maxCelsius,
      "description", &T::description,
      "humidity",    &T::humidity,
      "windSpeed",   &T::windSpeed,
      "pressure",    &T::pressure
    );
    // clang-format on
  };

  template <>
  struct meta<nimbus::cli::DetailsJson> {
    using T = nimbus::cli::DetailsJson;

    static constexpr auto value = object("location", &T::location, "forecast", &T::forecast);
  };
} // namespace glz
