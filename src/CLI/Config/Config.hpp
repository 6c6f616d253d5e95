#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Nimbus++/Core/Temperature.hpp>
#include <Nimbus++/Services/RateLimiter.hpp>
#include <Nimbus++/Services/WeatherProvider.hpp>
#include <Nimbus++/Services/WeatherRepository.hpp>
#include <Nimbus++/Services/WeatherSummary.hpp>
#include <Nimbus++/Utils/Definitions.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::config {
  namespace {
    using core::TemperatureUnit;

    using utils::types::f64;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::u32;
    using utils::types::usize;
  } // namespace

  /**
   * @struct ProviderConfig
   * @brief Upstream connection settings, read from [provider].
   */
  struct ProviderConfig {
    String apiKey;                                      ///< Overridden by NIMBUS_API_KEY when set.
    String baseUrl   = "https://api.openweathermap.org"; ///< Scheme and host, no trailing slash.
    i64    timeoutMs = 10000;                           ///< Whole-request timeout.

    static fn fromToml(const toml::table& tbl) -> ProviderConfig;

    [[nodiscard]] fn toOptions() const -> services::weather::ProviderOptions;
  };

  /**
   * @struct CacheConfig
   * @brief Cache lifetimes in minutes, read from [cache].
   */
  struct CacheConfig {
    i64   weatherMinutes  = 15;
    i64   forecastMinutes = 60;
    i64   locationMinutes = 24 * 60;
    usize maxEntries      = 1000; ///< Per cache. 0 disables the bound.

    static fn fromToml(const toml::table& tbl) -> CacheConfig;
  };

  /**
   * @struct RateLimitConfig
   * @brief Token bucket sizes, read from [rate_limit].
   */
  struct RateLimitConfig {
    u32 maxRequestsPerDay    = 1000;  ///< Upstream calls the summary service may make per day.
    u32 globalDailyLimit     = 10000; ///< Client requests admitted per day across all clients.
    u32 perClientHourlyLimit = 100;
    u32 burstLimit           = 10;
    i64 burstWindowMinutes   = 5;

    static fn fromToml(const toml::table& tbl) -> RateLimitConfig;

    [[nodiscard]] fn toPolicy() const -> services::ratelimit::RateLimitPolicy;
  };

  /**
   * @struct ApiConfig
   * @brief Request defaults, read from [api].
   */
  struct ApiConfig {
    TemperatureUnit defaultUnit         = TemperatureUnit::Celsius;
    u32             defaultForecastDays = 5;
    Option<f64>     temperatureCeiling  = None; ///< Celsius. Unset means no ceiling.
    bool            coordinateFallback  = false;

    static fn fromToml(const toml::table& tbl) -> ApiConfig;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    ProviderConfig  provider;
    CacheConfig     cache;
    RateLimitConfig rateLimit;
    ApiConfig       api;

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The parsed file, containing [provider], [cache], [rate_limit] and [api].
     */
    explicit Config(const toml::table& tbl);

    [[nodiscard]] fn repositoryOptions() const -> services::weather::RepositoryOptions;

    [[nodiscard]] fn summaryOptions() const -> services::weather::SummaryOptions;

    /**
     * @brief Locates the configuration file, creating a default one if none exists.
     *
     * Search order: $XDG_CONFIG_HOME/nimbus++/config.toml,
     * $HOME/.config/nimbus++/config.toml, ./config.toml.
     */
    static fn getConfigPath() -> std::filesystem::path;

    /**
     * @brief Loads the configuration from disk.
     *
     * Falls back to defaults when the file cannot be read or parsed. The
     * NIMBUS_API_KEY environment variable always wins over the file.
     */
    static fn getInstance() -> Config;
  };
} // namespace nimbus::config
