#include "Nimbus++/Services/WeatherRepository.hpp"

#include <format> // std::format

#include "Nimbus++/Utils/Logging.hpp"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using nimbus::core::Location;
using nimbus::core::WeatherData;
using nimbus::core::WeatherForecast;
using nimbus::utils::cache::CacheStats;
using nimbus::utils::clock::IClock;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace {
  /**
   * @brief Narrows a provider failure to what callers act on.
   *
   * The provider's own message is kept in the log only; callers see a
   * generic "service unavailable" for anything but NotFound.
   */
  fn ToRepositoryError(const NimbusError& providerError, const StringView what) -> NimbusError {
    if (providerError.code == NotFound)
      return { NotFound, std::format("{} not found", what) };

    warn_log("Weather provider failed while fetching {}: {} ({})", what, providerError.message, providerError.code);

    return { ApiUnavailable, "Weather service unavailable" };
  }
} // namespace

namespace nimbus::services::weather {
  WeatherRepository::WeatherRepository(UniquePointer<IWeatherProvider> provider, const RepositoryOptions& options, SharedPointer<const IClock> clock)
    : m_provider(std::move(provider)),
      m_coordinateFallback(options.coordinateFallback),
      m_weatherCache("weather", options.weather, clock),
      m_forecastCache("forecast", options.forecast, clock),
      m_locationCache("location", options.location, clock) {}

  fn WeatherRepository::getCurrentWeather(const Location& location) -> Result<WeatherData> {
    return m_weatherCache.getOrLoad(std::format("weather_{}", location.id), [&]() -> Result<WeatherData> {
      Result<WeatherData> data = m_provider->getCurrentWeather(location.coordinates);

      if (!data)
        return Err(ToRepositoryError(data.error(), std::format("current weather for {}", location.id)));

      return data;
    });
  }

  fn WeatherRepository::getForecast(const Location& location, const u32 days) -> Result<WeatherForecast> {
    return m_forecastCache.getOrLoad(std::format("forecast_{}_{}d", location.id, days), [&]() -> Result<WeatherForecast> {
      Result<WeatherForecast> forecast = m_provider->getForecast(location.coordinates, days);

      if (!forecast)
        return Err(ToRepositoryError(forecast.error(), std::format("forecast for {}", location.id)));

      if (forecast->forecasts.empty())
        ERR_FMT(NotFound, "No forecast available for {}", location.id);

      // The provider names the place on its own; keep the caller's resolved location.
      forecast->location = location;

      return forecast;
    });
  }

  fn WeatherRepository::getLocationById(const StringView id) -> Result<Location> {
    Result<Coordinates> coordinates = Coordinates::Parse(id);

    if (!coordinates)
      return Err(coordinates.error());

    // Cache under the canonical form so "51.50,-0.12" and "51.5,-0.12" share an entry.
    const String key = coordinates->toString();

    return m_locationCache.getOrLoad(key, [&]() -> Result<Location> {
      Result<Location> location = m_provider->getLocationDetails(*coordinates);

      if (location)
        return location;

      if (location.error().code == NotFound && m_coordinateFallback) {
        debug_log("No provider record for {}, using its coordinates as the name", key);
        return Location::Unnamed(*coordinates);
      }

      return Err(ToRepositoryError(location.error(), std::format("location {}", key)));
    });
  }

  fn WeatherRepository::getLocationsByIds(const Span<const String> ids) -> Vec<Location> {
    Vec<Location> locations;
    locations.reserve(ids.size());

    for (const String& id : ids) {
      Result<Location> location = getLocationById(id);

      if (!location) {
        warn_at(location.error());
        continue;
      }

      locations.push_back(*std::move(location));
    }

    return locations;
  }

  fn WeatherRepository::cacheStats() const -> Array<CacheStats, 3> {
    return { m_weatherCache.stats(), m_forecastCache.stats(), m_locationCache.stats() };
  }

  fn WeatherRepository::invalidateAll() -> Unit {
    m_weatherCache.invalidateAll();
    m_forecastCache.invalidateAll();
    m_locationCache.invalidateAll();
  }
} // namespace nimbus::services::weather
