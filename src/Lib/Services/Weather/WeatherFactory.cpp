#include <mutex> // std::{call_once, once_flag}

#include "Nimbus++/Services/WeatherProvider.hpp"
#include "Nimbus++/Utils/Logging.hpp"

#include "Core/TextUtils.hpp"
#include "Services/Weather/OpenWeatherMapProvider.hpp"
#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using enum nimbus::utils::error::NimbusErrorCode;

namespace {
  // curl_global_init is not thread-safe; run it once before the first handle exists.
  fn EnsureCurlInitialized() -> Result<> {
    static std::once_flag Once;
    static Result<>       InitResult;

    std::call_once(Once, [] { InitResult = Curl::GlobalInit(); });

    return InitResult;
  }
} // namespace

namespace nimbus::services::weather {
  fn CreateWeatherProvider(const ProviderKind kind, const ProviderOptions& options) -> Result<UniquePointer<IWeatherProvider>> {
    using enum ProviderKind;

    if (Result<> init = EnsureCurlInitialized(); !init)
      return Err(init.error());

    switch (kind) {
      case OpenWeatherMap:
        if (core::text::IsBlank(options.apiKey))
          ERR(ConfigurationError, "OpenWeatherMap requires an API key (set [provider].api_key or NIMBUS_API_KEY)");

        if (core::text::IsBlank(options.baseUrl))
          ERR(ConfigurationError, "OpenWeatherMap base URL cannot be blank");

        debug_log("Using OpenWeatherMap at {} with a {}ms timeout", options.baseUrl, options.timeout.count());

        return std::make_unique<OpenWeatherMapProvider>(options);
    }

    ERR(InternalError, "Unknown weather provider kind");
  }
} // namespace nimbus::services::weather
