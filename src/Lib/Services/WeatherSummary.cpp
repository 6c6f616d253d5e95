#include "Nimbus++/Services/WeatherSummary.hpp"

#include <algorithm> // std::{max, ranges::find_if}
#include <format>    // std::format

#include "Nimbus++/Core/Timezone.hpp"
#include "Nimbus++/Utils/Logging.hpp"

#include "Core/TextUtils.hpp"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using nimbus::core::DailyForecast;
using nimbus::core::Location;
using nimbus::core::LocationSummary;
using nimbus::core::LocationWeatherDetails;
using nimbus::core::Temperature;
using nimbus::core::TemperatureUnit;
using nimbus::core::WeatherForecast;
using nimbus::services::ratelimit::RateLimitStats;
using nimbus::services::ratelimit::TokenBucket;
using nimbus::utils::clock::IClock;
using nimbus::utils::clock::TimePoint;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using enum nimbus::utils::error::ValidationReason;

namespace {
  // Today is usually a partial first day, so tomorrow needs a second one.
  constexpr u32 MIN_SUMMARY_FORECAST_DAYS = 2;
} // namespace

namespace nimbus::services::weather {
  fn SelectTomorrow(const WeatherForecast& forecast, const Coordinates& coordinates, const TimePoint nowUtc) -> Option<DailyForecast> {
    const Vec<DailyForecast>& days = forecast.forecasts;

    if (days.empty())
      return None;

    const std::chrono::year_month_day tomorrow = core::timezone::Tomorrow(coordinates, nowUtc);

    if (auto match = std::ranges::find_if(days, [&](const DailyForecast& day) { return day.date == tomorrow; }); match != days.end())
      return *match;

    debug_log("No forecast day matches tomorrow ({}) at {}, falling back by position", tomorrow, coordinates);

    return days.size() > 1 ? days[1] : days[0];
  }

  WeatherSummaryService::WeatherSummaryService(
    UniquePointer<WeatherRepository> repository,
    UniquePointer<TokenBucket>       rateLimiter,
    const SummaryOptions&            options,
    SharedPointer<const IClock>      clock
  )
    : m_repository(std::move(repository)),
      m_rateLimiter(std::move(rateLimiter)),
      m_options(options),
      m_clock(std::move(clock)) {}

  fn WeatherSummaryService::consumeToken() -> Result<> {
    if (m_rateLimiter->tryConsume()) {
      debug_log("Consumed upstream token, {} left", m_rateLimiter->remaining());
      return {};
    }

    ERR_FMT(
      RateLimited,
      "Rate limit exceeded. Try again in {}s",
      std::chrono::ceil<std::chrono::seconds>(m_rateLimiter->timeUntilReset()).count()
    );
  }

  fn WeatherSummaryService::getWeatherSummaryForFavorites(const StringView coordinatesCsv, const StringView temperature, const Option<StringView> unit) -> Result<Vec<LocationSummary>> {
    if (core::text::IsBlank(coordinatesCsv))
      ERR(MissingParameter, "Missing required parameter: locations");

    if (core::text::IsBlank(temperature))
      ERR(MissingParameter, "Missing required parameter: temperature");

    Result<TemperatureUnit> parsedUnit = core::ParseTemperatureUnit(unit);
    if (!parsedUnit)
      return Err(parsedUnit.error());

    Result<Vec<Coordinates>> coordinates = Coordinates::ParseMultiple(coordinatesCsv);
    if (!coordinates)
      return Err(coordinates.error());

    if (coordinates->size() > m_options.maxLocations)
      ERR_FMT(TooManyLocations, "At most {} locations are allowed per request, got {}", m_options.maxLocations, coordinates->size());

    Result<Temperature> threshold = Temperature::Parse(temperature, *parsedUnit, m_options.bounds);
    if (!threshold)
      return Err(threshold.error());

    if (const f64 celsius = threshold->toCelsius(); celsius < m_options.minThresholdCelsius || celsius > m_options.maxThresholdCelsius)
      ERR_FMT(
        ThresholdOutOfRange,
        "Temperature threshold must be between {}°C and {}°C, got {}",
        m_options.minThresholdCelsius,
        m_options.maxThresholdCelsius,
        threshold->format()
      );

    return summarize(*coordinates, *threshold);
  }

  fn WeatherSummaryService::summarize(const Span<const Coordinates> coordinates, const Temperature& threshold) -> Result<Vec<LocationSummary>> {
    if (coordinates.size() > m_options.maxLocations)
      ERR_FMT(TooManyLocations, "At most {} locations are allowed per request, got {}", m_options.maxLocations, coordinates.size());

    info_log("Summarizing {} locations warmer than {}", coordinates.size(), threshold.format());

    Vec<LocationSummary> summaries;

    for (const Coordinates& coords : coordinates) {
      Result<LocationOutcome> outcome = summarizeLocation(coords, threshold);

      if (!outcome)
        return Err(outcome.error());

      if (outcome->stage == SummaryStage::Included)
        summaries.push_back(*std::move(outcome->summary));
      else if (outcome->stage == SummaryStage::Failed && outcome->error)
        warn_at(*outcome->error);
    }

    return summaries;
  }

  fn WeatherSummaryService::summarizeLocation(const Coordinates& coordinates, const Temperature& threshold) -> Result<LocationOutcome> {
    if (Result<> token = consumeToken(); !token)
      return Err(token.error());

    LocationOutcome outcome { .coordinates = coordinates };

    const auto fail = [&](NimbusError error) -> LocationOutcome {
      outcome.stage = SummaryStage::Failed;
      outcome.error = std::move(error);
      return outcome;
    };

    Result<Location> location = m_repository->getLocationById(coordinates.toString());
    if (!location)
      return fail(location.error());

    outcome.stage = SummaryStage::LocationResolved;

    Result<WeatherForecast> forecast = m_repository->getForecast(*location, std::max(m_options.forecastDays, MIN_SUMMARY_FORECAST_DAYS));
    if (!forecast)
      return fail(forecast.error());

    outcome.stage = SummaryStage::ForecastResolved;

    Option<DailyForecast> tomorrow = SelectTomorrow(*forecast, coordinates, m_clock->now());
    if (!tomorrow)
      return fail(NimbusError(NotFound, std::format("No forecast for tomorrow at {}", coordinates)));

    if (!tomorrow->temperatureMax.isAbove(threshold)) {
      debug_log("{} excluded: tomorrow's maximum {} is not above {}", location->id, tomorrow->temperatureMax.format(), threshold.format());
      outcome.stage = SummaryStage::Excluded;
      return outcome;
    }

    debug_log("{} included: tomorrow's maximum {} is above {}", location->id, tomorrow->temperatureMax.format(), threshold.format());

    outcome.stage   = SummaryStage::Included;
    outcome.summary = LocationSummary {
      .locationId             = location->id,
      .locationName           = location->name,
      .country                = location->country,
      .tomorrowMaxTemperature = tomorrow->temperatureMax.toUnit(threshold.unit()).value(),
      .temperatureUnit        = String(core::UnitName(threshold.unit())),
      .weatherDescription     = tomorrow->description,
    };

    return outcome;
  }

  fn WeatherSummaryService::getLocationWeatherDetails(const StringView coordinate) -> Result<Option<LocationWeatherDetails>> {
    if (core::text::IsBlank(coordinate))
      ERR(MissingParameter, "Missing required parameter: location");

    Result<Coordinates> coordinates = Coordinates::Parse(coordinate);
    if (!coordinates)
      return Err(coordinates.error());

    if (Result<> token = consumeToken(); !token)
      return Err(token.error());

    Result<Location> location = m_repository->getLocationById(coordinates->toString());

    if (!location) {
      if (location.error().code == NotFound) {
        debug_at(location.error());
        return None;
      }

      return Err(location.error());
    }

    Result<WeatherForecast> forecast = m_repository->getForecast(*location, m_options.forecastDays);

    if (!forecast) {
      if (forecast.error().code == NotFound) {
        debug_at(forecast.error());
        return None;
      }

      return Err(forecast.error());
    }

    return LocationWeatherDetails {
      .location = *location,
      .forecast = *std::move(forecast),
    };
  }

  fn WeatherSummaryService::getRemainingRequests() const -> u32 {
    return m_rateLimiter->remaining();
  }

  fn WeatherSummaryService::rateLimitStats() const -> RateLimitStats {
    return m_rateLimiter->stats();
  }
} // namespace nimbus::services::weather
