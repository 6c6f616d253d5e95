#include "RequestHandler.hpp"

#include <cstdlib>                   // EXIT_FAILURE, EXIT_SUCCESS
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <sstream>                   // std::istringstream

#include <Nimbus++/Utils/Logging.hpp>

#include "Core/JsonOutput.hpp"
#include "UI/UI.hpp"

using namespace nimbus::utils::types;
using nimbus::core::LocationSummary;
using nimbus::core::LocationWeatherDetails;
using nimbus::core::Temperature;
using nimbus::core::TemperatureUnit;
using nimbus::services::ratelimit::RateLimitPolicy;
using nimbus::services::ratelimit::RateLimitRejection;
using nimbus::services::weather::WeatherSummaryService;
using nimbus::utils::argparse::ArgumentParser;
using nimbus::utils::argparse::ParseOutcome;
using nimbus::utils::clock::IClock;
using nimbus::utils::error::NimbusError;

namespace nimbus::cli {
  fn AddRequestArguments(ArgumentParser& parser) -> Unit {
    parser
      .addArguments("--locations")
      .help("Comma-separated coordinates to compare, e.g. \"51.5074,-0.1278,48.8566,2.3522\".");

    parser
      .addArguments("--temperature")
      .help("Threshold that tomorrow's maximum must exceed.");

    parser
      .addArguments("--unit")
      .help("Unit of --temperature and of the reported values. Defaults to [api].default_unit.")
      .choices({ "celsius", "c", "fahrenheit", "f" });

    parser
      .addArguments("--details")
      .help("Show the multi-day forecast for a single \"lat,lon\" instead of a summary.");

    parser
      .addArguments("--client")
      .help("Client identifier used for per-client rate limiting.")
      .defaultValue(String("cli"));

    parser
      .addArguments("--json")
      .help("Output the result as JSON.")
      .flag();

    parser
      .addArguments("--pretty")
      .help("Pretty-print JSON output. Only valid when --json is used.")
      .flag();
  }

  fn ReadRequest(const ArgumentParser& parser) -> Request {
    return {
      .locations   = parser.getOptional("--locations"),
      .temperature = parser.getOptional("--temperature"),
      .unit        = parser.getOptional("--unit"),
      .details     = parser.getOptional("--details"),
      .client      = parser.get<String>("--client"),
      .jsonOutput  = parser.get<bool>("--json"),
      .prettyJson  = parser.get<bool>("--pretty"),
    };
  }

  fn ParseRequestLine(const StringView line) -> Result<Option<Request>> {
    // Element 0 stands in for the program name, which parseArgs skips.
    Vec<String> args = { "nimbus" };

    std::istringstream stream { String(line) };

    for (String token; stream >> token;)
      args.push_back(std::move(token));

    ArgumentParser parser("nimbus", NIMBUS_VERSION);
    AddRequestArguments(parser);

    Result<ParseOutcome> outcome = parser.parseArgs(args);

    if (!outcome)
      return Err(outcome.error());

    if (*outcome != ParseOutcome::Run)
      return None;

    return ReadRequest(parser);
  }

  fn FailureResponse(const NimbusError& error) -> Response {
    error_at(error);

    if (error.reason)
      return { EXIT_FAILURE, std::format("Request rejected: {} ({})\n", error.message, magic_enum::enum_name(*error.reason)) };

    return { EXIT_FAILURE, std::format("Request failed: {} ({})\n", error.message, magic_enum::enum_name(error.code)) };
  }

  RequestHandler::RequestHandler(
    UniquePointer<WeatherSummaryService> service,
    const RateLimitPolicy&               admissionPolicy,
    const TemperatureUnit                defaultUnit,
    SharedPointer<const IClock>          clock
  )
    : m_service(std::move(service)),
      m_admission(admissionPolicy, std::move(clock)),
      m_defaultUnit(defaultUnit) {}

  fn RequestHandler::handle(const Request& request) -> Response {
    if (Result<Unit, RateLimitRejection> admitted = m_admission.admit(request.client); !admitted)
      return FailureResponse(services::ratelimit::ToError(admitted.error()));

    if (request.details)
      return runDetails(request);

    return runSummary(request);
  }

  fn RequestHandler::handleLine(const StringView line) -> Response {
    Result<Option<Request>> request = ParseRequestLine(line);

    if (!request)
      return FailureResponse(request.error());

    if (!*request)
      return {};

    return handle(**request);
  }

  fn RequestHandler::runDetails(const Request& request) -> Response {
    Result<Option<LocationWeatherDetails>> details = m_service->getLocationWeatherDetails(*request.details);

    if (!details)
      return FailureResponse(details.error());

    if (!*details)
      return { EXIT_FAILURE, std::format("Location not found: {}\n", *request.details) };

    if (!request.jsonOutput)
      return { EXIT_SUCCESS, ui::CreateDetailsReport(**details) };

    Result<String> json = WriteDetailsJson(**details, request.prettyJson);

    if (!json)
      return FailureResponse(json.error());

    return { EXIT_SUCCESS, *json + "\n" };
  }

  fn RequestHandler::runSummary(const Request& request) -> Response {
    const String unitName = request.unit.value_or(String(core::UnitName(m_defaultUnit)));

    Result<Vec<LocationSummary>> summaries =
      m_service->getWeatherSummaryForFavorites(request.locations.value_or(""), request.temperature.value_or(""), unitName);

    if (!summaries)
      return FailureResponse(summaries.error());

    debug_log("{} locations matched for '{}', {} upstream requests left today", summaries->size(), request.client, m_service->getRemainingRequests());

    if (request.jsonOutput) {
      Result<String> json = WriteSummaryJson(*summaries, request.prettyJson);

      if (!json)
        return FailureResponse(json.error());

      return { EXIT_SUCCESS, *json + "\n" };
    }

    // Both already passed validation inside the service.
    Result<TemperatureUnit> unit = core::ParseTemperatureUnit(StringView(unitName));

    if (!unit)
      return FailureResponse(unit.error());

    Result<Temperature> threshold = Temperature::Parse(*request.temperature, *unit, m_service->options().bounds);

    if (!threshold)
      return FailureResponse(threshold.error());

    return { EXIT_SUCCESS, ui::CreateSummaryReport(*summaries, *threshold) };
  }
} // namespace nimbus::cli
