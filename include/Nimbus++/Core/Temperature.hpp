#pragma once

#include <matchit.hpp> // matchit::{match, is}

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::core {
  namespace {
    using utils::types::f64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
  } // namespace

  enum class TemperatureUnit : u8 {
    Celsius,
    Fahrenheit,
  };

  /**
   * @brief Optional upper bound applied when building temperatures from user input.
   */
  struct TemperatureBounds {
    Option<f64> ceilingCelsius = None; ///< Rejects values above this (Celsius-equivalent). Off when unset.
  };

  /**
   * @brief A temperature that is never below absolute zero.
   *
   * Comparison and ordering always happen on the Celsius-equivalent value, so a
   * Fahrenheit reading can be compared against a Celsius threshold directly.
   */
  class Temperature {
   public:
    static constexpr f64 ABSOLUTE_ZERO_CELSIUS = -273.15;

    Temperature() = default;

    static fn Create(f64 value, TemperatureUnit unit, const TemperatureBounds& bounds = {}) -> Result<Temperature>;

    static fn FromCelsius(f64 value) -> Result<Temperature>;

    static fn FromFahrenheit(f64 value) -> Result<Temperature>;

    /**
     * @brief Parses a numeric string in the given unit.
     */
    static fn Parse(StringView text, TemperatureUnit unit, const TemperatureBounds& bounds = {}) -> Result<Temperature>;

    [[nodiscard]] fn value() const -> f64 {
      return m_value;
    }

    [[nodiscard]] fn unit() const -> TemperatureUnit {
      return m_unit;
    }

    [[nodiscard]] fn toCelsius() const -> f64;
    [[nodiscard]] fn toFahrenheit() const -> f64;

    /**
     * @brief Returns the same temperature expressed in @p target.
     */
    [[nodiscard]] fn toUnit(TemperatureUnit target) const -> Temperature;

    /**
     * @brief Strictly greater than @p other, compared in Celsius.
     */
    [[nodiscard]] fn isAbove(const Temperature& other) const -> bool {
      return toCelsius() > other.toCelsius();
    }

    /**
     * @brief Formats with one decimal and the unit symbol, e.g. "25.0°C".
     */
    [[nodiscard]] fn format() const -> String;

   private:
    Temperature(const f64 value, const TemperatureUnit unit)
      : m_value(value), m_unit(unit) {}

    f64             m_value = 0.0;
    TemperatureUnit m_unit  = TemperatureUnit::Celsius;
  };

  /**
   * @brief Parses a unit name.
   *
   * Accepts "celsius"/"c" and "fahrenheit"/"f" in any case. An absent or blank
   * value means Celsius.
   */
  fn ParseTemperatureUnit(Option<StringView> text) -> Result<TemperatureUnit>;

  /**
   * @brief Lower-case unit name as used in summaries ("celsius" or "fahrenheit").
   */
  constexpr fn UnitName(const TemperatureUnit unit) -> StringView {
    using matchit::match, matchit::is;

    return match(unit)(
      is | TemperatureUnit::Celsius    = StringView("celsius"),
      is | TemperatureUnit::Fahrenheit = StringView("fahrenheit")
    );
  }

  constexpr fn UnitSymbol(const TemperatureUnit unit) -> StringView {
    return unit == TemperatureUnit::Celsius ? "°C" : "°F";
  }
} // namespace nimbus::core
