#include "OpenWeatherMapProvider.hpp"

#include <algorithm>   // std::min
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, _}
#include <utility>     // std::move

#include "Nimbus++/Utils/Error.hpp"
#include "Nimbus++/Utils/Logging.hpp"
#include "Nimbus++/Utils/Types.hpp"

#include "Core/TextUtils.hpp"
#include "DataTransferObjects.hpp"
#include "WeatherUtils.hpp"
#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using nimbus::core::Location;
using nimbus::core::Temperature;
using nimbus::core::WeatherData;
using nimbus::core::WeatherForecast;
using nimbus::services::weather::OpenWeatherMapProvider;
using nimbus::services::weather::ProviderOptions;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace owm = nimbus::services::weather::dto::owm;

namespace {
  constexpr std::chrono::milliseconds MAX_CONNECT_TIMEOUT = std::chrono::seconds(5);

  fn StatusToError(const long status, const String& body) -> NimbusError {
    using matchit::match, matchit::is, matchit::_;

    owm::ErrorResponse errorBody;

    String message = std::format("OpenWeatherMap API error (HTTP {})", status);

    // The body is informational only; an undecodable one still yields the status error.
    if (const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(errorBody, body); errc.ec == glz::error_code::none && errorBody.message && !errorBody.message->empty())
      message += std::format(": {}", *errorBody.message);

    return { match(status)(
               is | 401 = PermissionDenied,
               is | 404 = NotFound,
               is | 429 = ResourceExhausted,
               is | _   = Other
             ),
             message };
  }

  /**
   * @brief Performs a GET and decodes a 2xx body into @p T.
   * @param url Full request URL, including the API key.
   * @param endpoint Path used in log lines so the key never reaches the log.
   */
  template <typename T>
  fn MakeApiRequest(const String& url, const StringView endpoint, const ProviderOptions& options) -> Result<T> {
    String responseBuffer;

    Curl::Easy curl({
      .url            = url,
      .writeBuffer    = &responseBuffer,
      .timeout        = options.timeout,
      .connectTimeout = std::min(options.timeout, MAX_CONNECT_TIMEOUT),
      .userAgent      = options.userAgent,
    });

    if (!curl) {
      if (const Option<NimbusError>& initError = curl.getInitializationError())
        return Err(*initError);

      ERR(InternalError, "Failed to initialize cURL (Easy handle is invalid after construction)");
    }

    debug_log("OpenWeatherMap request: {}", endpoint);

    if (Result res = curl.perform(); !res)
      return Err(res.error());

    Result<long> status = curl.responseCode();
    if (!status)
      return Err(status.error());

    if (*status < 200 || *status >= 300)
      return Err(StatusToError(*status, responseBuffer));

    T response {};

    if (const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(response, responseBuffer); errc.ec != glz::error_code::none)
      ERR_FMT(ParseError, "Failed to parse {} response: {}", endpoint, glz::format_error(errc, responseBuffer));

    return response;
  }

  // Prefers the provider's name for the place and falls back to the bare coordinates.
  fn NamedOrUnnamed(const Coordinates& coordinates, const String& name, const Option<String>& country) -> Location {
    using nimbus::core::text::IsBlank;

    if (IsBlank(name))
      return Location::Unnamed(coordinates);

    if (Result<Location> location = Location::Create(coordinates, name, country && !IsBlank(*country) ? *country : "Unknown"))
      return *std::move(location);

    return Location::Unnamed(coordinates);
  }
} // namespace

namespace nimbus::services::weather {
  OpenWeatherMapProvider::OpenWeatherMapProvider(ProviderOptions options)
    : m_options(std::move(options)) {}

  fn OpenWeatherMapProvider::getCurrentWeather(const Coordinates& coordinates) const -> Result<WeatherData> {
    const String url = std::format(
      "{}/data/2.5/weather?lat={}&lon={}&appid={}&units=metric",
      m_options.baseUrl,
      coordinates.latitude(),
      coordinates.longitude(),
      m_options.apiKey
    );

    Result<owm::CurrentResponse> response = MakeApiRequest<owm::CurrentResponse>(url, "/data/2.5/weather", m_options);
    if (!response)
      return Err(response.error());

    Result<Temperature> temperature = Temperature::FromCelsius(response->main.temp);
    if (!temperature)
      ERR_FMT(ParseError, "OpenWeatherMap returned an impossible temperature: {}", temperature.error().message);

    WeatherData data {
      .location    = NamedOrUnnamed(coordinates, response->name, response->sys.country),
      .timestamp   = std::chrono::sys_seconds(std::chrono::seconds(response->dt)),
      .temperature = *temperature,
      .description = helpers::FirstDescription(response->weather),
      .humidity    = response->main.humidity,
      .windSpeed   = response->wind.speed,
      .pressure    = response->main.pressure,
    };

    if (Result<> valid = data.validate(); !valid)
      ERR_FMT(ParseError, "OpenWeatherMap returned inconsistent current weather: {}", valid.error().message);

    return data;
  }

  fn OpenWeatherMapProvider::getForecast(const Coordinates& coordinates, const u32 days) const -> Result<WeatherForecast> {
    const u32 slotCount = helpers::ForecastSlotCount(days);

    const String url = std::format(
      "{}/data/2.5/forecast?lat={}&lon={}&cnt={}&appid={}&units=metric",
      m_options.baseUrl,
      coordinates.latitude(),
      coordinates.longitude(),
      slotCount,
      m_options.apiKey
    );

    Result<owm::ForecastResponse> response = MakeApiRequest<owm::ForecastResponse>(url, "/data/2.5/forecast", m_options);
    if (!response)
      return Err(response.error());

    Result<Vec<core::DailyForecast>> daily = helpers::AggregateDailyForecasts(response->list, coordinates, days);
    if (!daily)
      ERR_FMT(ParseError, "OpenWeatherMap returned an unusable forecast: {}", daily.error().message);

    debug_log("Aggregated {} forecast slots into {} days for {}", response->list.size(), daily->size(), coordinates);

    return WeatherForecast {
      .location  = NamedOrUnnamed(coordinates, response->city.name, response->city.country),
      .forecasts = *std::move(daily),
    };
  }

  fn OpenWeatherMapProvider::getLocationDetails(const Coordinates& coordinates) const -> Result<Location> {
    const String url = std::format(
      "{}/geo/1.0/reverse?lat={}&lon={}&limit=1&appid={}",
      m_options.baseUrl,
      coordinates.latitude(),
      coordinates.longitude(),
      m_options.apiKey
    );

    Result<Vec<owm::GeocodeEntry>> entries = MakeApiRequest<Vec<owm::GeocodeEntry>>(url, "/geo/1.0/reverse", m_options);
    if (!entries)
      return Err(entries.error());

    if (entries->empty())
      ERR_FMT(NotFound, "No place known at {}", coordinates);

    const owm::GeocodeEntry& entry = entries->front();

    // The id must stay the requested position, not the provider's snapped one.
    return NamedOrUnnamed(coordinates, entry.name, entry.country);
  }

  fn OpenWeatherMapProvider::searchLocations(const StringView query, const u32 limit) const -> Result<Vec<Location>> {
    if (core::text::IsBlank(query))
      return Err(NimbusError(utils::error::ValidationReason::MissingParameter, "Location search query cannot be blank"));

    Result<String> escaped = Curl::Easy::escape(core::text::Trim(query));
    if (!escaped)
      return Err(escaped.error());

    const String url = std::format("{}/geo/1.0/direct?q={}&limit={}&appid={}", m_options.baseUrl, *escaped, limit, m_options.apiKey);

    Result<Vec<owm::GeocodeEntry>> entries = MakeApiRequest<Vec<owm::GeocodeEntry>>(url, "/geo/1.0/direct", m_options);
    if (!entries)
      return Err(entries.error());

    Vec<Location> locations;
    locations.reserve(entries->size());

    for (const owm::GeocodeEntry& entry : *entries) {
      Result<Coordinates> coordinates = Coordinates::Create(entry.lat, entry.lon);

      if (!coordinates) {
        debug_at(coordinates.error());
        continue;
      }

      locations.push_back(NamedOrUnnamed(*coordinates, entry.name, entry.country));
    }

    return locations;
  }

  fn OpenWeatherMapProvider::getProviderName() const -> StringView {
    return "OpenWeatherMap";
  }
} // namespace nimbus::services::weather
