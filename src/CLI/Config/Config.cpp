#include "Config.hpp"

#include <chrono>                 // std::chrono::{milliseconds, minutes}
#include <filesystem>             // std::filesystem::{path, operator/, exists, create_directories}
#include <fstream>                // std::{ofstream, operator<<}
#include <limits>                 // std::numeric_limits
#include <system_error>           // std::error_code
#include <toml++/impl/parser.hpp> // toml::{parse_file, parse_error}

#include <Nimbus++/Utils/Env.hpp>
#include <Nimbus++/Utils/Logging.hpp>

namespace fs = std::filesystem;

using namespace nimbus::utils::types;
using nimbus::core::TemperatureUnit;

namespace {
  constexpr PCStr DEFAULT_CONFIG_TEMPLATE = R"toml(# Nimbus++ Configuration File

[provider]
api_key = ""                                # OpenWeatherMap API key (NIMBUS_API_KEY overrides this)
base_url = "https://api.openweathermap.org"
timeout_ms = 10000                          # Upper bound for a single upstream request

[cache]
weather_minutes = 15   # Current conditions
forecast_minutes = 60  # Multi-day forecasts
location_minutes = 1440
max_entries = 1000     # Per cache, 0 for unbounded

[rate_limit]
max_requests_per_day = 1000     # Upstream calls made on your API key
global_daily_limit = 10000      # Requests admitted per day across all clients
per_client_hourly_limit = 100
burst_limit = 10
burst_window_minutes = 5

[api]
default_unit = "celsius"      # "celsius" or "fahrenheit"
default_forecast_days = 5
coordinate_fallback = false   # Answer with bare coordinates when the provider has no place name
# temperature_ceiling = 60.0  # Reject thresholds above this many degrees Celsius
)toml";

  /**
   * @brief Reads a non-negative integer that must fit in @p T.
   * @return The configured value, or @p fallback if absent or unusable.
   */
  template <typename T>
  fn ReadCount(const toml::table& tbl, const StringView key, const T fallback) -> T {
    const Option<i64> raw = tbl[key].value<i64>();

    if (!raw)
      return fallback;

    if (*raw < 0 || static_cast<u64>(*raw) > static_cast<u64>(std::numeric_limits<T>::max())) {
      warn_log("Config value '{}' = {} is out of range, using {}", key, *raw, fallback);
      return fallback;
    }

    return static_cast<T>(*raw);
  }

  fn CreateDefaultConfig(const fs::path& configPath) -> Result<> {
    std::error_code errc;
    create_directories(configPath.parent_path(), errc);

    if (errc)
      ERR_FROM(errc);

    std::ofstream file(configPath);
    if (!file)
      ERR_FMT(nimbus::utils::error::NimbusErrorCode::IoError, "Failed to open config file for writing: {}", configPath.string());

    file << DEFAULT_CONFIG_TEMPLATE;

    if (!file)
      ERR_FMT(nimbus::utils::error::NimbusErrorCode::IoError, "Failed to write to config file: {}", configPath.string());

    info_log("Created default config file at {}", configPath.string());
    return {};
  }
} // namespace

namespace nimbus::config {
  fn ProviderConfig::fromToml(const toml::table& tbl) -> ProviderConfig {
    ProviderConfig provider;

    provider.apiKey    = tbl["api_key"].value_or(String());
    provider.baseUrl   = tbl["base_url"].value_or(provider.baseUrl);
    provider.timeoutMs = ReadCount<i64>(tbl, "timeout_ms", provider.timeoutMs);

    while (provider.baseUrl.ends_with('/'))
      provider.baseUrl.pop_back();

    // libcurl reads a zero timeout as "wait forever".
    if (provider.timeoutMs == 0) {
      warn_log("timeout_ms must be at least 1, using 10000");
      provider.timeoutMs = ProviderConfig {}.timeoutMs;
    }

    return provider;
  }

  fn ProviderConfig::toOptions() const -> services::weather::ProviderOptions {
    return {
      .apiKey    = apiKey,
      .baseUrl   = baseUrl,
      .timeout   = std::chrono::milliseconds(timeoutMs),
      .userAgent = NIMBUS_USER_AGENT,
    };
  }

  fn CacheConfig::fromToml(const toml::table& tbl) -> CacheConfig {
    CacheConfig cache;

    cache.weatherMinutes  = ReadCount<i64>(tbl, "weather_minutes", cache.weatherMinutes);
    cache.forecastMinutes = ReadCount<i64>(tbl, "forecast_minutes", cache.forecastMinutes);
    cache.locationMinutes = ReadCount<i64>(tbl, "location_minutes", cache.locationMinutes);
    cache.maxEntries      = ReadCount<usize>(tbl, "max_entries", cache.maxEntries);

    return cache;
  }

  fn RateLimitConfig::fromToml(const toml::table& tbl) -> RateLimitConfig {
    RateLimitConfig limits;

    limits.maxRequestsPerDay    = ReadCount<u32>(tbl, "max_requests_per_day", limits.maxRequestsPerDay);
    limits.globalDailyLimit     = ReadCount<u32>(tbl, "global_daily_limit", limits.globalDailyLimit);
    limits.perClientHourlyLimit = ReadCount<u32>(tbl, "per_client_hourly_limit", limits.perClientHourlyLimit);
    limits.burstLimit           = ReadCount<u32>(tbl, "burst_limit", limits.burstLimit);
    limits.burstWindowMinutes   = ReadCount<i64>(tbl, "burst_window_minutes", limits.burstWindowMinutes);

    return limits;
  }

  fn RateLimitConfig::toPolicy() const -> services::ratelimit::RateLimitPolicy {
    return {
      .globalDailyLimit     = globalDailyLimit,
      .perClientHourlyLimit = perClientHourlyLimit,
      .burstLimit           = burstLimit,
      .burstWindow          = std::chrono::minutes(burstWindowMinutes),
    };
  }

  fn ApiConfig::fromToml(const toml::table& tbl) -> ApiConfig {
    ApiConfig api;

    if (const Option<String> unitName = tbl["default_unit"].value<String>()) {
      if (Result<TemperatureUnit> unit = core::ParseTemperatureUnit(*unitName))
        api.defaultUnit = *unit;
      else
        warn_log("Invalid default_unit '{}' in config. Accepted values are 'celsius' and 'fahrenheit'.", *unitName);
    }

    api.defaultForecastDays = ReadCount<u32>(tbl, "default_forecast_days", api.defaultForecastDays);
    api.temperatureCeiling  = tbl["temperature_ceiling"].value<f64>();
    api.coordinateFallback  = tbl["coordinate_fallback"].value_or(false);

    if (api.defaultForecastDays == 0) {
      warn_log("default_forecast_days must be at least 1, using 5");
      api.defaultForecastDays = 5;
    }

    return api;
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view providerTbl  = tbl["provider"];
    const toml::node_view cacheTbl     = tbl["cache"];
    const toml::node_view rateLimitTbl = tbl["rate_limit"];
    const toml::node_view apiTbl       = tbl["api"];

    this->provider  = providerTbl.is_table() ? ProviderConfig::fromToml(*providerTbl.as_table()) : ProviderConfig {};
    this->cache     = cacheTbl.is_table() ? CacheConfig::fromToml(*cacheTbl.as_table()) : CacheConfig {};
    this->rateLimit = rateLimitTbl.is_table() ? RateLimitConfig::fromToml(*rateLimitTbl.as_table()) : RateLimitConfig {};
    this->api       = apiTbl.is_table() ? ApiConfig::fromToml(*apiTbl.as_table()) : ApiConfig {};
  }

  fn Config::repositoryOptions() const -> services::weather::RepositoryOptions {
    using std::chrono::minutes;

    return {
      .weather            = { .ttl = minutes(cache.weatherMinutes), .maxEntries = cache.maxEntries },
      .forecast           = { .ttl = minutes(cache.forecastMinutes), .maxEntries = cache.maxEntries },
      .location           = { .ttl = minutes(cache.locationMinutes), .maxEntries = cache.maxEntries },
      .coordinateFallback = api.coordinateFallback,
    };
  }

  fn Config::summaryOptions() const -> services::weather::SummaryOptions {
    return {
      .forecastDays = api.defaultForecastDays,
      .bounds       = { .ceilingCelsius = api.temperatureCeiling },
    };
  }

  fn Config::getConfigPath() -> fs::path {
    using utils::env::GetEnv;

    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "nimbus++" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "nimbus++" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  fn Config::getInstance() -> Config {
    Config config;

    try {
      const fs::path configPath = getConfigPath();

      std::error_code errc;

      if (!fs::exists(configPath, errc)) {
        info_log("Config file not found at {}, creating defaults.", configPath.string());

        if (Result<> created = CreateDefaultConfig(configPath); !created) {
          error_at(created.error());
          warn_log("Continuing with built-in defaults");
        }
      }

      if (fs::exists(configPath, errc)) {
        config = Config(toml::parse_file(configPath.string()));
        debug_log("Config loaded from {}", configPath.string());
      }
    } catch (const toml::parse_error& e) {
      error_log("Failed to parse config file: {}, using defaults", e.description());
    } catch (const Exception& e) {
      error_log("Config loading failed: {}, using defaults", e.what());
    }

    if (Result<String> envKey = utils::env::GetEnv("NIMBUS_API_KEY")) {
      debug_log("Using API key from NIMBUS_API_KEY");
      config.provider.apiKey = *envKey;
    }

    return config;
  }
} // namespace nimbus::config
