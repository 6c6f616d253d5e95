#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::core {
  namespace {
    using utils::types::f64;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief A validated geographic position.
   *
   * Latitude is always within [-90, 90] and longitude within [-180, 180].
   * Instances only come out of the factories below, which reject anything
   * else with an InvalidArgument error. The default value is (0, 0).
   */
  class Coordinates {
   public:
    static constexpr f64 MIN_LATITUDE  = -90.0;
    static constexpr f64 MAX_LATITUDE  = 90.0;
    static constexpr f64 MIN_LONGITUDE = -180.0;
    static constexpr f64 MAX_LONGITUDE = 180.0;

    Coordinates() = default;

    /**
     * @brief Validates and builds coordinates from numeric values.
     */
    static fn Create(f64 latitude, f64 longitude) -> Result<Coordinates>;

    /**
     * @brief Parses a single "lat,lon" pair.
     *
     * Surrounding whitespace is ignored. Exactly two numeric fields are required.
     */
    static fn Parse(StringView text) -> Result<Coordinates>;

    /**
     * @brief Parses a flat comma-separated list "lat1,lon1,lat2,lon2,..." into pairs.
     *
     * Empty tokens are dropped. Fails on an odd number of values or an empty list.
     */
    static fn ParseMultiple(StringView text) -> Result<Vec<Coordinates>>;

    [[nodiscard]] fn latitude() const -> f64 {
      return m_latitude;
    }

    [[nodiscard]] fn longitude() const -> f64 {
      return m_longitude;
    }

    /**
     * @brief Formats as "lat,lon" using the shortest text that parses back to the same values.
     */
    [[nodiscard]] fn toString() const -> String;

    fn operator==(const Coordinates&) const -> bool = default;

   private:
    Coordinates(const f64 latitude, const f64 longitude)
      : m_latitude(latitude), m_longitude(longitude) {}

    f64 m_latitude  = 0.0;
    f64 m_longitude = 0.0;
  };
} // namespace nimbus::core

template <>
struct std::formatter<nimbus::core::Coordinates> : std::formatter<nimbus::utils::types::String> {
  fn format(const nimbus::core::Coordinates& coords, std::format_context& ctx) const {
    return std::formatter<nimbus::utils::types::String>::format(coords.toString(), ctx);
  }
};
