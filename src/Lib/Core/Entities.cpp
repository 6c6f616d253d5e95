#include "Nimbus++/Core/Entities.hpp"

#include "Core/TextUtils.hpp"

using namespace nimbus::utils::types;
using enum nimbus::utils::error::ValidationReason;

namespace nimbus::core {
  fn Location::Create(const Coordinates& coordinates, String name, String country) -> Result<Location> {
    if (text::IsBlank(name))
      ERR_FMT(BlankField, "Location name for {} cannot be blank", coordinates);

    if (text::IsBlank(country))
      ERR_FMT(BlankField, "Country for {} cannot be blank", coordinates);

    return Location {
      .id          = coordinates.toString(),
      .name        = std::move(name),
      .country     = std::move(country),
      .coordinates = coordinates,
    };
  }

  fn Location::Unnamed(const Coordinates& coordinates) -> Location {
    String id = coordinates.toString();

    return Location {
      .id          = id,
      .name        = id,
      .country     = "Unknown",
      .coordinates = coordinates,
    };
  }

  fn WeatherData::validate() const -> Result<> {
    if (!(humidity >= 0.0 && humidity <= 100.0))
      ERR_FMT(OutOfRange, "Humidity must be between 0 and 100, got {}", humidity);

    if (!(windSpeed >= 0.0))
      ERR_FMT(OutOfRange, "Wind speed cannot be negative, got {}", windSpeed);

    if (!(pressure > 0.0))
      ERR_FMT(OutOfRange, "Pressure must be positive, got {}", pressure);

    if (text::IsBlank(description))
      ERR(BlankField, "Weather description cannot be blank");

    return {};
  }
} // namespace nimbus::core
