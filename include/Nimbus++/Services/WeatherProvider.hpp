#pragma once

#include <chrono> // std::chrono::milliseconds

#include "../Core/Coordinates.hpp"
#include "../Core/Entities.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::weather {
  namespace {
    using core::Coordinates;
    using core::Location;
    using core::WeatherData;
    using core::WeatherForecast;

    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u32;
    using utils::types::u8;
    using utils::types::UniquePointer;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Specifies the upstream weather provider.
   */
  enum class ProviderKind : u8 {
    OpenWeatherMap, ///< OpenWeatherMap API. Requires an API key.
  };

  /**
   * @struct ProviderOptions
   * @brief Connection settings shared by every provider.
   */
  struct ProviderOptions {
    String                    apiKey;
    String                    baseUrl   = "https://api.openweathermap.org";
    std::chrono::milliseconds timeout   = std::chrono::seconds(10); ///< Upper bound for a whole request.
    String                    userAgent = NIMBUS_USER_AGENT;
  };

  /**
   * @brief Upstream weather data source.
   *
   * Implementations report expected failures through Result and never throw
   * for them. Error codes follow this mapping:
   *  - connection failures: NetworkError
   *  - request timeouts: Timeout
   *  - upstream quota exhausted: ResourceExhausted
   *  - rejected API key: PermissionDenied
   *  - unknown position: NotFound
   *  - anything else: Other (or ParseError for undecodable bodies)
   */
  class IWeatherProvider {
   public:
    IWeatherProvider(const IWeatherProvider&) = delete;
    IWeatherProvider(IWeatherProvider&&)      = delete;

    fn operator=(const IWeatherProvider&)->IWeatherProvider& = delete;
    fn operator=(IWeatherProvider&&)->IWeatherProvider&      = delete;

    virtual ~IWeatherProvider() = default;

    [[nodiscard]] virtual fn getCurrentWeather(const Coordinates& coordinates) const -> Result<WeatherData> = 0;

    /**
     * @brief Daily forecast for up to @p days local days, starting today.
     */
    [[nodiscard]] virtual fn getForecast(const Coordinates& coordinates, u32 days) const -> Result<WeatherForecast> = 0;

    /**
     * @brief Reverse-geocodes a position. NotFound if the provider has no place there.
     */
    [[nodiscard]] virtual fn getLocationDetails(const Coordinates& coordinates) const -> Result<Location> = 0;

    /**
     * @brief Forward-geocodes a free-text place name.
     */
    [[nodiscard]] virtual fn searchLocations(StringView query, u32 limit) const -> Result<Vec<Location>> = 0;

    [[nodiscard]] virtual fn getProviderName() const -> StringView = 0;

   protected:
    IWeatherProvider() = default;
  };

  /**
   * @brief Builds a provider of the requested kind.
   * @return ConfigurationError if a required setting (such as the API key) is missing.
   */
  fn CreateWeatherProvider(ProviderKind kind, const ProviderOptions& options) -> Result<UniquePointer<IWeatherProvider>>;
} // namespace nimbus::services::weather
