#pragma once

#include <Nimbus++/Core/Temperature.hpp>
#include <Nimbus++/Services/RateLimiter.hpp>
#include <Nimbus++/Services/WeatherSummary.hpp>
#include <Nimbus++/Utils/ArgumentParser.hpp>
#include <Nimbus++/Utils/Clock.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::cli {
  namespace {
    using core::TemperatureUnit;

    using services::ratelimit::LayeredRateLimiter;
    using services::ratelimit::RateLimitPolicy;
    using services::weather::WeatherSummaryService;

    using utils::argparse::ArgumentParser;
    using utils::clock::IClock;
    using utils::error::NimbusError;

    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::UniquePointer;
    using utils::types::Unit;
  } // namespace

  /**
   * @struct Request
   * @brief One summary or details question, as given on the command line or on one line of --serve input.
   */
  struct Request {
    Option<String> locations;
    Option<String> temperature;
    Option<String> unit;
    Option<String> details;
    String         client     = "cli";
    bool           jsonOutput = false;
    bool           prettyJson = false;
  };

  /**
   * @struct Response
   * @brief What a request printed and how it ended.
   */
  struct Response {
    i32    exitCode = 0;
    String output; ///< Text for stdout, newline-terminated unless empty.
  };

  /**
   * @brief Registers the per-request options (--locations, --details, --client, ...) on @p parser.
   */
  fn AddRequestArguments(ArgumentParser& parser) -> Unit;

  fn ReadRequest(const ArgumentParser& parser) -> Request;

  /**
   * @brief Parses one --serve input line, e.g. `--client alice --details 51.5,-0.12 --json`.
   * @return None if the line only asked for help or the version.
   */
  fn ParseRequestLine(StringView line) -> Result<Option<Request>>;

  /**
   * @brief Admits requests per client and answers them from one summary service.
   *
   * The admission limiter, the service and the caches behind it live as long
   * as the handler, so limits and cached forecasts carry over between
   * requests. handle() may be called from several threads at once.
   */
  class RequestHandler {
   public:
    RequestHandler(
      UniquePointer<WeatherSummaryService> service,
      const RateLimitPolicy&               admissionPolicy,
      TemperatureUnit                      defaultUnit,
      SharedPointer<const IClock>          clock = utils::clock::GetSystemClock()
    );

    fn handle(const Request& request) -> Response;

    /**
     * @brief Parses and handles one --serve input line.
     */
    fn handleLine(StringView line) -> Response;

    [[nodiscard]] fn admission() -> LayeredRateLimiter& {
      return m_admission;
    }

   private:
    UniquePointer<WeatherSummaryService> m_service;
    LayeredRateLimiter                   m_admission;
    TemperatureUnit                      m_defaultUnit;

    fn runDetails(const Request& request) -> Response;
    fn runSummary(const Request& request) -> Response;
  };

  /**
   * @brief Logs @p error and turns it into the one-line failure answer shown to the user.
   */
  fn FailureResponse(const NimbusError& error) -> Response;
} // namespace nimbus::cli
