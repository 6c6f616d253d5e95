#include <chrono>   // std::chrono::hours
#include <cstdio>   // std::fflush, stdout
#include <cstdlib>  // EXIT_FAILURE, EXIT_SUCCESS
#include <deque>    // std::deque
#include <future>   // std::{async, future, launch}
#include <iostream> // std::{cin, getline}

#include <Nimbus++/Services/RateLimiter.hpp>
#include <Nimbus++/Services/WeatherProvider.hpp>
#include <Nimbus++/Services/WeatherRepository.hpp>
#include <Nimbus++/Services/WeatherSummary.hpp>
#include <Nimbus++/Utils/ArgumentParser.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/RequestHandler.hpp"

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;
using namespace nimbus::config;

using nimbus::cli::Request;
using nimbus::cli::RequestHandler;
using nimbus::cli::Response;
using nimbus::services::weather::WeatherSummaryService;

namespace {
  // Requests answered at once in --serve mode. Answers still come out in input order.
  constexpr usize MAX_IN_FLIGHT = 8;

  fn BuildService(const Config& config) -> Result<UniquePointer<WeatherSummaryService>> {
    using namespace nimbus::services;

    Result<UniquePointer<weather::IWeatherProvider>> provider =
      weather::CreateWeatherProvider(weather::ProviderKind::OpenWeatherMap, config.provider.toOptions());

    if (!provider)
      return Err(provider.error());

    debug_log("Using weather provider {}", (*provider)->getProviderName());

    return std::make_unique<WeatherSummaryService>(
      std::make_unique<weather::WeatherRepository>(*std::move(provider), config.repositoryOptions()),
      std::make_unique<ratelimit::TokenBucket>(config.rateLimit.maxRequestsPerDay, std::chrono::hours(24)),
      config.summaryOptions()
    );
  }

  fn Emit(const Response& response) -> i32 {
    Print(response.output);
    return response.exitCode;
  }

  /**
   * @brief Answers one request per stdin line until end of input.
   * @return EXIT_FAILURE if any request failed.
   */
  fn Serve(RequestHandler& handler) -> i32 {
    std::deque<std::future<Response>> inFlight;
    i32                               status = EXIT_SUCCESS;

    const auto emitOldest = [&] {
      if (Emit(inFlight.front().get()) != EXIT_SUCCESS)
        status = EXIT_FAILURE;

      inFlight.pop_front();
      std::fflush(stdout);
    };

    for (String line; std::getline(std::cin, line);) {
      if (line.find_first_not_of(" \t\r") == String::npos)
        continue;

      if (inFlight.size() >= MAX_IN_FLIGHT)
        emitOldest();

      inFlight.push_back(std::async(std::launch::async, [&handler, line = std::move(line)] { return handler.handleLine(line); }));
    }

    while (!inFlight.empty())
      emitOldest();

    return status;
  }
} // namespace

fn main(const i32 argc, PCStr argv[]) -> i32 try {
  Request request;
  bool    serve = false;

  {
    using nimbus::utils::argparse::ArgumentParser;
    using nimbus::utils::argparse::ParseOutcome;

    ArgumentParser parser("nimbus", NIMBUS_VERSION);

    nimbus::cli::AddRequestArguments(parser);

    parser
      .addArguments("--serve")
      .help("Read one request per line from stdin (same options as above) and answer each on stdout. Rate limits and caches are shared by all lines.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    Result<ParseOutcome> outcome = parser.parseArgs({ argv, static_cast<usize>(argc) });

    if (!outcome) {
      error_at(outcome.error());
      return EXIT_FAILURE;
    }

    if (*outcome != ParseOutcome::Run)
      return EXIT_SUCCESS;

    request = nimbus::cli::ReadRequest(parser);
    serve   = parser.get<bool>("--serve");

    SetRuntimeLogLevel(
      parser.get<bool>("--verbose")
        ? LogLevel::Debug
        : parser.getEnum<LogLevel>("--log-level").value_or(LogLevel::Info)
    );

    if (!serve && !request.details && !request.locations && !request.temperature) {
      parser.printHelp();
      return EXIT_FAILURE;
    }
  }

  const Config config = Config::getInstance();

  Result<UniquePointer<WeatherSummaryService>> service = BuildService(config);

  if (!service)
    return Emit(nimbus::cli::FailureResponse(service.error()));

  RequestHandler handler(*std::move(service), config.rateLimit.toPolicy(), config.api.defaultUnit);

  if (serve)
    return Serve(handler);

  return Emit(handler.handle(request));
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
