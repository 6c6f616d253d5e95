#pragma once

#include "../Core/Coordinates.hpp"
#include "../Core/Entities.hpp"
#include "../Core/Temperature.hpp"
#include "../Utils/Clock.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

#include "RateLimiter.hpp"
#include "WeatherRepository.hpp"

namespace nimbus::services::weather {
  namespace {
    using core::DailyForecast;
    using core::LocationSummary;
    using core::LocationWeatherDetails;
    using core::Temperature;
    using core::TemperatureBounds;

    using ratelimit::RateLimitStats;
    using ratelimit::TokenBucket;

    using utils::clock::TimePoint;
    using utils::error::NimbusError;

    using utils::types::f64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::usize;
  } // namespace

  /**
   * @struct SummaryOptions
   * @brief Request limits of a WeatherSummaryService.
   */
  struct SummaryOptions {
    u32               forecastDays        = 5;  ///< Days requested per location. Summaries always ask for at least two.
    usize             maxLocations        = 50; ///< Largest batch a single summary may carry.
    TemperatureBounds bounds              = {}; ///< Applied when parsing the threshold.
    f64               minThresholdCelsius = -100.0;
    f64               maxThresholdCelsius = 100.0;
  };

  /**
   * @brief Progress of one location through a summary.
   *
   * Pending -> LocationResolved -> ForecastResolved -> Included | Excluded.
   * Any step may end in Failed instead.
   */
  enum class SummaryStage : u8 {
    Pending,
    LocationResolved,
    ForecastResolved,
    Included,
    Excluded,
    Failed,
  };

  struct LocationOutcome {
    Coordinates             coordinates;
    SummaryStage            stage   = SummaryStage::Pending;
    Option<LocationSummary> summary = None; ///< Set when stage is Included.
    Option<NimbusError>     error   = None; ///< Set when stage is Failed.
  };

  /**
   * @brief Picks the forecast day that is "tomorrow" at @p coordinates.
   *
   * A day whose date equals the approximate local tomorrow wins. Without one,
   * the second day is used, and the first if there is only one.
   *
   * @return None if @p forecast has no days.
   */
  fn SelectTomorrow(const WeatherForecast& forecast, const Coordinates& coordinates, TimePoint nowUtc) -> Option<DailyForecast>;

  /**
   * @brief Answers "which of these places will be warmer than X tomorrow?".
   *
   * Each location costs one token from the upstream rate limiter. Running out
   * of tokens aborts the whole batch; any other per-location failure only drops
   * that location from the answer.
   */
  class WeatherSummaryService {
   public:
    WeatherSummaryService(
      UniquePointer<WeatherRepository> repository,
      UniquePointer<TokenBucket>       rateLimiter,
      const SummaryOptions&            options = {},
      SharedPointer<const IClock>      clock   = utils::clock::GetSystemClock()
    );

    WeatherSummaryService(const WeatherSummaryService&)                = delete;
    fn operator=(const WeatherSummaryService&)->WeatherSummaryService& = delete;

    /**
     * @brief Validates raw request input, then summarizes every location.
     *
     * Nothing reaches the provider if any input is invalid.
     *
     * @param coordinatesCsv Flat list "lat1,lon1,lat2,lon2,...".
     * @param temperature Threshold as text, in @p unit.
     * @param unit "celsius"/"c" or "fahrenheit"/"f"; Celsius when absent.
     * @return Locations whose tomorrow maximum is strictly above the threshold, in input order.
     */
    fn getWeatherSummaryForFavorites(StringView coordinatesCsv, StringView temperature, Option<StringView> unit = None) -> Result<Vec<LocationSummary>>;

    /**
     * @brief Typed variant of getWeatherSummaryForFavorites.
     */
    fn summarize(Span<const Coordinates> coordinates, const Temperature& threshold) -> Result<Vec<LocationSummary>>;

    /**
     * @brief Runs a single location through the summary pipeline.
     * @return RateLimited if no token is left, otherwise the location's outcome.
     */
    fn summarizeLocation(const Coordinates& coordinates, const Temperature& threshold) -> Result<LocationOutcome>;

    /**
     * @brief Location and multi-day forecast for one "lat,lon" string.
     * @return None if the provider knows nothing about the position.
     */
    fn getLocationWeatherDetails(StringView coordinate) -> Result<Option<LocationWeatherDetails>>;

    [[nodiscard]] fn getRemainingRequests() const -> u32;

    [[nodiscard]] fn rateLimitStats() const -> RateLimitStats;

    [[nodiscard]] fn repository() const -> WeatherRepository& {
      return *m_repository;
    }

    [[nodiscard]] fn options() const -> const SummaryOptions& {
      return m_options;
    }

   private:
    UniquePointer<WeatherRepository> m_repository;
    UniquePointer<TokenBucket>       m_rateLimiter;
    SummaryOptions                   m_options;
    SharedPointer<const IClock>      m_clock;

    fn consumeToken() -> Result<>;
  };
} // namespace nimbus::services::weather
