#pragma once

#include "Nimbus++/Services/WeatherProvider.hpp"

#include "Nimbus++/Utils/Types.hpp"

namespace nimbus::services::weather {
  class OpenWeatherMapProvider final : public IWeatherProvider {
   public:
    explicit OpenWeatherMapProvider(ProviderOptions options);

    fn getCurrentWeather(const Coordinates& coordinates) const -> Result<WeatherData> override;
    fn getForecast(const Coordinates& coordinates, u32 days) const -> Result<WeatherForecast> override;
    fn getLocationDetails(const Coordinates& coordinates) const -> Result<Location> override;
    fn searchLocations(StringView query, u32 limit) const -> Result<Vec<Location>> override;
    fn getProviderName() const -> StringView override;

   private:
    ProviderOptions m_options;
  };
} // namespace nimbus::services::weather
