#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils {
  namespace error {
    namespace {
      using types::None;
      using types::Option;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum NimbusErrorCode
     * @brief General categories of failure reported through Result.
     */
    enum class NimbusErrorCode : u8 {
      ApiUnavailable,     ///< The weather service cannot answer right now (provider fault, timeout, bad key).
      ConfigurationError, ///< Configuration or environment issue.
      InternalError,      ///< An error occurred within the application's own logic.
      InvalidArgument,    ///< Caller input failed validation. See NimbusError::reason.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NetworkError,       ///< A network-related error occurred (e.g., DNS resolution, connection failure).
      NotFound,           ///< The requested location or data does not exist.
      Other,              ///< A generic or unclassified error, typically an unexpected upstream status.
      OutOfMemory,        ///< An allocation failed.
      ParseError,         ///< Failed to parse data (upstream JSON, config file, ...).
      PermissionDenied,   ///< The upstream rejected our credentials.
      RateLimited,        ///< A local rate limiter refused the request.
      ResourceExhausted,  ///< The upstream reported its own quota as exhausted (HTTP 429).
      Timeout,            ///< An operation timed out.
    };

    /**
     * @enum ValidationReason
     * @brief Machine-readable detail attached to InvalidArgument errors.
     */
    enum class ValidationReason : u8 {
      MissingParameter,     ///< A required input was absent or blank.
      MalformedCoordinates, ///< A coordinate string was not two numeric fields.
      LatitudeOutOfRange,   ///< Latitude outside [-90, 90].
      LongitudeOutOfRange,  ///< Longitude outside [-180, 180].
      OddCoordinateCount,   ///< A coordinate list had an unpaired value.
      TooManyLocations,     ///< More locations than a single request may carry.
      InvalidTemperature,   ///< A temperature string was not numeric.
      BelowAbsoluteZero,    ///< Temperature below -273.15 °C.
      AboveCeiling,         ///< Temperature above the configured ceiling.
      ThresholdOutOfRange,  ///< Threshold outside the accepted query range.
      InvalidUnit,          ///< Unrecognised temperature unit.
      BlankField,           ///< A required text field of an entity was blank.
      OutOfRange,           ///< A numeric entity field was outside its domain.
    };

    /**
     * @struct NimbusError
     * @brief Holds structured information about a failure.
     *
     * Used as the error type in Result throughout the library.
     */
    struct NimbusError {
      String                   message;       ///< A descriptive error message.
      std::source_location     location;      ///< The source location where the error occurred (file, line, function).
      NimbusErrorCode          code;          ///< The general category of the error.
      Option<ValidationReason> reason = None; ///< Set for InvalidArgument errors raised by validation.

      NimbusError(const NimbusErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      NimbusError(const ValidationReason why, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(NimbusErrorCode::InvalidArgument), reason(why) {}

      explicit NimbusError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum NimbusErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | not_enough_memory                                                            = OutOfMemory,
          is | or_(network_unreachable, network_down, connection_refused)                   = NetworkError,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = InternalError
        );
      }

      /**
       * @brief Checks whether this is a validation failure with the given reason.
       */
      [[nodiscard]] fn hasReason(const ValidationReason why) const -> bool {
        return code == NimbusErrorCode::InvalidArgument && reason == why;
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::NimbusError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::NimbusError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace nimbus::utils

namespace std {
  template <>
  struct formatter<::nimbus::utils::error::NimbusErrorCode> : formatter<::nimbus::utils::types::StringView> {
    template <typename FormatContext>
    fn format(nimbus::utils::error::NimbusErrorCode code, FormatContext& ctx) const {
      using enum nimbus::utils::error::NimbusErrorCode;
      using matchit::match, matchit::is, matchit::_;

      nimbus::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | ConfigurationError = "ConfigurationError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | Other              = "Other",
        is | OutOfMemory        = "OutOfMemory",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | RateLimited        = "RateLimited",
        is | ResourceExhausted  = "ResourceExhausted",
        is | Timeout            = "Timeout",
        is | _                  = "Unknown"
      );

      return formatter<nimbus::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, msg))
#define ERR_FROM(err)           return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(err))
#define ERR_FMT(errc, fmt, ...) return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, std::format(fmt, __VA_ARGS__)))
