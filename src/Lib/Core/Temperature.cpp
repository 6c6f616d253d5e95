#include "Nimbus++/Core/Temperature.hpp"

#include <charconv> // std::from_chars
#include <cmath>    // std::isfinite
#include <format>   // std::format

#include "Core/TextUtils.hpp"

using namespace nimbus::utils::types;
using enum nimbus::utils::error::ValidationReason;

namespace {
  constexpr f64 CONVERSION_TOLERANCE = 1e-9;

  constexpr fn FahrenheitToCelsius(const f64 fahrenheit) -> f64 {
    return (fahrenheit - 32.0) * 5.0 / 9.0;
  }

  constexpr fn CelsiusToFahrenheit(const f64 celsius) -> f64 {
    return celsius * 9.0 / 5.0 + 32.0;
  }
} // namespace

namespace nimbus::core {
  fn Temperature::Create(const f64 value, const TemperatureUnit unit, const TemperatureBounds& bounds) -> Result<Temperature> {
    if (!std::isfinite(value))
      ERR_FMT(InvalidTemperature, "Temperature must be a finite number, got {}", value);

    const f64 celsius = unit == TemperatureUnit::Celsius ? value : FahrenheitToCelsius(value);

    if (celsius < ABSOLUTE_ZERO_CELSIUS - CONVERSION_TOLERANCE)
      ERR_FMT(BelowAbsoluteZero, "Temperature {:.2f}{} is below absolute zero", value, UnitSymbol(unit));

    if (bounds.ceilingCelsius && celsius > *bounds.ceilingCelsius)
      ERR_FMT(AboveCeiling, "Temperature {:.2f}{} is above the allowed maximum of {:.2f}°C", value, UnitSymbol(unit), *bounds.ceilingCelsius);

    return Temperature(value, unit);
  }

  fn Temperature::FromCelsius(const f64 value) -> Result<Temperature> {
    return Create(value, TemperatureUnit::Celsius);
  }

  fn Temperature::FromFahrenheit(const f64 value) -> Result<Temperature> {
    return Create(value, TemperatureUnit::Fahrenheit);
  }

  fn Temperature::Parse(const StringView text, const TemperatureUnit unit, const TemperatureBounds& bounds) -> Result<Temperature> {
    StringView trimmed = text::Trim(text);

    if (trimmed.empty())
      ERR(MissingParameter, "Temperature is required");

    if (trimmed.starts_with('+'))
      trimmed.remove_prefix(1);

    f64 value = 0.0;

    const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

    if (errc != std::errc {} || ptr != trimmed.data() + trimmed.size())
      ERR_FMT(InvalidTemperature, "Invalid temperature value '{}'", text);

    return Create(value, unit, bounds);
  }

  fn Temperature::toCelsius() const -> f64 {
    return m_unit == TemperatureUnit::Celsius ? m_value : FahrenheitToCelsius(m_value);
  }

  fn Temperature::toFahrenheit() const -> f64 {
    return m_unit == TemperatureUnit::Fahrenheit ? m_value : CelsiusToFahrenheit(m_value);
  }

  fn Temperature::toUnit(const TemperatureUnit target) const -> Temperature {
    if (target == m_unit)
      return *this;

    return { target == TemperatureUnit::Celsius ? toCelsius() : toFahrenheit(), target };
  }

  fn Temperature::format() const -> String {
    return std::format("{:.1f}{}", m_value, UnitSymbol(m_unit));
  }

  fn ParseTemperatureUnit(const Option<StringView> text) -> Result<TemperatureUnit> {
    if (!text || text::IsBlank(*text))
      return TemperatureUnit::Celsius;

    const String lowered = text::ToLower(text::Trim(*text));

    if (lowered == "celsius" || lowered == "c")
      return TemperatureUnit::Celsius;

    if (lowered == "fahrenheit" || lowered == "f")
      return TemperatureUnit::Fahrenheit;

    ERR_FMT(InvalidUnit, "Invalid temperature unit '{}', expected 'celsius' or 'fahrenheit'", *text);
  }
} // namespace nimbus::core
