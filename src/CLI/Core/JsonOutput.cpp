#include "JsonOutput.hpp"

#include <chrono>               // std::chrono::year_month_day
#include <format>               // std::format
#include <glaze/json/write.hpp> // glz::{write, write_json, format_error}

using namespace nimbus::utils::types;
using nimbus::core::DailyForecast;
using nimbus::core::LocationSummary;
using nimbus::core::LocationWeatherDetails;
using enum nimbus::utils::error::NimbusErrorCode;

namespace {
  template <typename T>
  fn Serialize(const T& value, const bool pretty) -> Result<String> {
    String jsonStr;

    glz::error_ctx errorContext =
      pretty
      ? glz::write<glz::opts { .prettify = true }>(value, jsonStr)
      : glz::write_json(value, jsonStr);

    if (errorContext)
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }
} // namespace

namespace nimbus::cli {
  fn ToDetailsJson(const LocationWeatherDetails& details) -> DetailsJson {
    DetailsJson output {
      .location = {
        .id        = details.location.id,
        .name      = details.location.name,
        .country   = details.location.country,
        .latitude  = details.location.coordinates.latitude(),
        .longitude = details.location.coordinates.longitude(),
      },
      .forecast = {},
    };

    output.forecast.reserve(details.forecast.forecasts.size());

    for (const DailyForecast& day : details.forecast.forecasts)
      output.forecast.push_back({
        .date        = std::format("{:%F}", day.date),
        .minCelsius  = day.temperatureMin.toCelsius(),
        .maxCelsius  = day.temperatureMax.toCelsius(),
        .description = day.description,
        .humidity    = day.humidity,
        .windSpeed   = day.windSpeed,
        .pressure    = day.pressure,
      });

    return output;
  }

  fn WriteSummaryJson(const Vec<LocationSummary>& summaries, const bool pretty) -> Result<String> {
    return Serialize(summaries, pretty);
  }

  fn WriteDetailsJson(const LocationWeatherDetails& details, const bool pretty) -> Result<String> {
    return Serialize(ToDetailsJson(details), pretty);
  }
} // namespace nimbus::cli
