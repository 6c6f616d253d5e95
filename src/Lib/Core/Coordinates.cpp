#include "Nimbus++/Core/Coordinates.hpp"

#include <charconv> // std::from_chars
#include <format>   // std::format

#include "Nimbus++/Utils/Error.hpp"
#include "Nimbus++/Utils/Types.hpp"

#include "Core/TextUtils.hpp"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::ValidationReason;

namespace {
  fn ParseNumber(const StringView field) -> Option<f64> {
    StringView trimmed = nimbus::core::text::Trim(field);

    if (trimmed.starts_with('+'))
      trimmed.remove_prefix(1);

    if (trimmed.empty())
      return None;

    f64 value = 0.0;

    const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

    if (errc != std::errc {} || ptr != trimmed.data() + trimmed.size())
      return None;

    return value;
  }
} // namespace

namespace nimbus::core {
  fn Coordinates::Create(const f64 latitude, const f64 longitude) -> Result<Coordinates> {
    // Written as negated range checks so NaN is rejected too.
    if (!(latitude >= MIN_LATITUDE && latitude <= MAX_LATITUDE))
      ERR_FMT(LatitudeOutOfRange, "Latitude must be between -90 and 90, got {}", latitude);

    if (!(longitude >= MIN_LONGITUDE && longitude <= MAX_LONGITUDE))
      ERR_FMT(LongitudeOutOfRange, "Longitude must be between -180 and 180, got {}", longitude);

    return Coordinates(latitude, longitude);
  }

  fn Coordinates::Parse(const StringView text) -> Result<Coordinates> {
    const Vec<StringView> fields = text::Split(text::Trim(text), ',');

    if (fields.size() != 2)
      ERR_FMT(MalformedCoordinates, "Invalid coordinates format '{}', expected 'lat,lon'", text);

    const Option<f64> latitude  = ParseNumber(fields[0]);
    const Option<f64> longitude = ParseNumber(fields[1]);

    if (!latitude || !longitude)
      ERR_FMT(MalformedCoordinates, "Invalid coordinate values in '{}'", text);

    return Create(*latitude, *longitude);
  }

  fn Coordinates::ParseMultiple(const StringView text) -> Result<Vec<Coordinates>> {
    Vec<StringView> values;

    for (const StringView field : text::Split(text, ','))
      if (StringView trimmed = text::Trim(field); !trimmed.empty())
        values.push_back(trimmed);

    if (values.empty())
      ERR(MissingParameter, "At least one coordinate pair is required");

    if (values.size() % 2 != 0)
      ERR_FMT(OddCoordinateCount, "Coordinates must come in lat,lon pairs, got {} values", values.size());

    Vec<Coordinates> result;
    result.reserve(values.size() / 2);

    for (usize i = 0; i < values.size(); i += 2) {
      const Option<f64> latitude  = ParseNumber(values[i]);
      const Option<f64> longitude = ParseNumber(values[i + 1]);

      if (!latitude || !longitude)
        ERR_FMT(MalformedCoordinates, "Invalid coordinate values '{},{}'", values[i], values[i + 1]);

      Result<Coordinates> coords = Create(*latitude, *longitude);

      if (!coords)
        return Err(coords.error());

      result.push_back(*coords);
    }

    return result;
  }

  fn Coordinates::toString() const -> String {
    return std::format("{},{}", m_latitude, m_longitude);
  }
} // namespace nimbus::core
