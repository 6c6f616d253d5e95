#pragma once

#include <chrono> // std::chrono::{minutes, hours}

#include "../Core/Entities.hpp"
#include "../Utils/Cache.hpp"
#include "../Utils/Clock.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

#include "WeatherProvider.hpp"

namespace nimbus::services::weather {
  namespace {
    using utils::cache::Cache;
    using utils::cache::CachePolicy;
    using utils::cache::CacheStats;
    using utils::clock::IClock;

    using utils::types::Array;
    using utils::types::SharedPointer;
    using utils::types::Span;
    using utils::types::Unit;
  } // namespace

  /**
   * @struct RepositoryOptions
   * @brief Cache lifetimes and lookup behaviour of a WeatherRepository.
   */
  struct RepositoryOptions {
    CachePolicy weather  = { .ttl = std::chrono::minutes(15), .maxEntries = 1000 };
    CachePolicy forecast = { .ttl = std::chrono::minutes(60), .maxEntries = 1000 };
    CachePolicy location = { .ttl = std::chrono::hours(24), .maxEntries = 1000 };

    /// When the provider has no record of a position, answer with an unnamed
    /// location instead of NotFound.
    bool coordinateFallback = false;
  };

  /**
   * @brief Cache-aside access to a weather provider.
   *
   * Every lookup checks its cache first and only calls the provider on a
   * miss. Provider failures are narrowed to two outcomes: NotFound when the
   * provider does not know the position, ApiUnavailable for everything else.
   * Failures are never cached.
   */
  class WeatherRepository {
   public:
    WeatherRepository(UniquePointer<IWeatherProvider> provider, const RepositoryOptions& options, SharedPointer<const IClock> clock = utils::clock::GetSystemClock());

    WeatherRepository(const WeatherRepository&)                = delete;
    fn operator=(const WeatherRepository&)->WeatherRepository& = delete;

    /**
     * @brief Current conditions for @p location, cached under "weather_<id>".
     */
    fn getCurrentWeather(const Location& location) -> Result<WeatherData>;

    /**
     * @brief Daily forecast for @p location, cached under "forecast_<id>_<days>d".
     * @return NotFound if the provider returned no days.
     */
    fn getForecast(const Location& location, u32 days) -> Result<WeatherForecast>;

    /**
     * @brief Resolves a "lat,lon" id to a location, cached under the id itself.
     * @return InvalidArgument without contacting the provider if @p id is not a coordinate pair.
     */
    fn getLocationById(StringView id) -> Result<Location>;

    /**
     * @brief Resolves each id independently. Ids that fail are logged and left out.
     */
    fn getLocationsByIds(Span<const String> ids) -> Vec<Location>;

    [[nodiscard]] fn cacheStats() const -> Array<CacheStats, 3>;

    fn invalidateAll() -> Unit;

    [[nodiscard]] fn providerName() const -> StringView {
      return m_provider->getProviderName();
    }

   private:
    UniquePointer<IWeatherProvider> m_provider;
    bool                            m_coordinateFallback;

    Cache<WeatherData>     m_weatherCache;
    Cache<WeatherForecast> m_forecastCache;
    Cache<Location>        m_locationCache;
  };
} // namespace nimbus::services::weather
