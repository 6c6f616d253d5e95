#pragma once

// clang-format off
// we need glaze.hpp include before any other includes that might use it
// because core/meta.hpp complains about not having uint8_t defined otherwise
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include "Nimbus++/Utils/Types.hpp"
// clang-format on

// OpenWeatherMap response shapes. Only the fields we read are declared;
// everything else is skipped by reading with error_on_unknown_keys = false.
namespace nimbus::services::weather::dto::owm {
  namespace {
    using utils::types::f64;
    using utils::types::i64;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  struct Condition {
    String description;
  };

  struct Wind {
    f64 speed = 0.0;
  };

  struct CurrentMain {
    f64 temp     = 0.0;
    f64 pressure = 0.0;
    f64 humidity = 0.0;
  };

  struct CurrentSys {
    Option<String> country;
  };

  // GET /data/2.5/weather
  struct CurrentResponse {
    CurrentMain    main;
    Vec<Condition> weather;
    Wind           wind;
    i64            dt = 0;
    String         name;
    CurrentSys     sys;
  };

  struct ForecastMain {
    f64 temp     = 0.0;
    f64 tempMin  = 0.0;
    f64 tempMax  = 0.0;
    f64 pressure = 0.0;
    f64 humidity = 0.0;
  };

  // One three-hour slot.
  struct ForecastItem {
    i64            dt = 0;
    ForecastMain   main;
    Vec<Condition> weather;
    Wind           wind;
  };

  struct ForecastCity {
    String         name;
    Option<String> country;
  };

  // GET /data/2.5/forecast
  struct ForecastResponse {
    Vec<ForecastItem> list;
    ForecastCity      city;
  };

  // One element of the /geo/1.0/{reverse,direct} arrays.
  struct GeocodeEntry {
    String         name;
    f64            lat = 0.0;
    f64            lon = 0.0;
    Option<String> country;
    Option<String> state;
  };

  // Body of a non-2xx answer.
  struct ErrorResponse {
    Option<String> message;
  };
} // namespace nimbus::services::weather::dto::owm

namespace glz {
  namespace owm = nimbus::services::weather::dto::owm;

  template <>
  struct meta<owm::Condition> {
    static constexpr auto value = object("description", &owm::Condition::description);
  };

  template <>
  struct meta<owm::Wind> {
    static constexpr auto value = object("speed", &owm::Wind::speed);
  };

  template <>
  struct meta<owm::CurrentMain> {
    static constexpr auto value = object("temp", &owm::CurrentMain::temp, "pressure", &owm::CurrentMain::pressure, "humidity", &owm::CurrentMain::humidity);
  };

  template <>
  struct meta<owm::CurrentSys> {
    static constexpr auto value = object("country", &owm::CurrentSys::country);
  };

  template <>
  struct meta<owm::CurrentResponse> {
    using T = owm::CurrentResponse;

    // clang-format off
    static constexpr auto value = object(
      "main",    &T::main,
      "weather", &T::weather,
      "wind",    &T::wind,
      "dt",      &T::dt,
      "name",    &T::name,
      "sys",     &T::sys
    );
    // clang-format on
  };

  template <>
  struct meta<owm::ForecastMain> {
    using T = owm::ForecastMain;

    // clang-format off
    static constexpr auto value = object(
      "temp",     &T::temp,
      "temp_min", &T::tempMin,
      "temp_max", &T::tempMax,
      "pressure", &T::pressure,
      "humidity", &T::humidity
    );
    // clang-format on
  };

  template <>
  struct meta<owm::ForecastItem> {
    static constexpr auto value = object("dt", &owm::ForecastItem::dt, "main", &owm::ForecastItem::main, "weather", &owm::ForecastItem::weather, "wind", &owm::ForecastItem::wind);
  };

  template <>
  struct meta<owm::ForecastCity> {
    static constexpr auto value = object("name", &owm::ForecastCity::name, "country", &owm::ForecastCity::country);
  };

  template <>
  struct meta<owm::ForecastResponse> {
    static constexpr auto value = object("list", &owm::ForecastResponse::list, "city", &owm::ForecastResponse::city);
  };

  template <>
  struct meta<owm::GeocodeEntry> {
    using T = owm::GeocodeEntry;

    // clang-format off
    static constexpr auto value = object(
      "name",    &T::name,
      "lat",     &T::lat,
      "lon",     &T::lon,
      "country", &T::country,
      "state",   &T::state
    );
    // clang-format on
  };

  template <>
  struct meta<owm::ErrorResponse> {
    static constexpr auto value = object("message", &owm::ErrorResponse::message);
  };
} // namespace glz
