#pragma once

#include <chrono>                    // std::chrono::{system_clock, floor, seconds}
#include <cstdio>                    // std::{FILE, fputs, fflush}, stdout, stderr
#include <filesystem>                // std::filesystem::path
#include <format>                    // std::{format, format_string}
#include <ftxui/screen/color.hpp>    // ftxui::Color::Palette16
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is}
#include <source_location>           // std::source_location
#include <type_traits>               // std::{decay_t, is_same_v, is_base_of_v}
#include <utility>                   // std::forward

#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::usize;
  } // namespace

  struct LogLevelConst {
    // 256-colour escapes for the first sixteen palette entries, indexed by ftxui::Color::Palette16.
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR  = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR  = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 MUTED_COLOR = ftxui::Color::Palette16::GrayLight;
  };

  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Messages below this level are dropped. Set once by the CLI from --log-level.
   */
  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> types::Unit {
    GetRuntimeLogLevel() = level;
  }

  inline fn Colorize(const StringView text, const ftxui::Color::Palette16& color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /**
   * @brief Fixed-width name of @p level, as shown in every log line.
   */
  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_STR,
      is | Info  = LogLevelConst::INFO_STR,
      is | Warn  = LogLevelConst::WARN_STR,
      is | Error = LogLevelConst::ERROR_STR
    );
  }

  namespace detail {
    inline fn StyledLevel(const LogLevel level) -> const String& {
      // Built on first use; the palette lookups are not constexpr.
      static const Array<String, 4> STYLED = {
        Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)),
        Bold(Colorize(LogLevelConst::INFO_STR, LogLevelConst::INFO_COLOR)),
        Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)),
        Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)),
      };

      return STYLED.at(static_cast<usize>(level));
    }

    inline fn Emit(std::FILE* stream, const StringView text) -> types::Unit {
      std::fputs(String(text).c_str(), stream);
    }
  } // namespace detail

  /**
   * @brief Writes report output to stdout.
   *
   * Log lines go to stderr instead, so `nimbus --json | jq` stays parseable.
   */
  template <typename... Args>
  inline fn Print(std::format_string<Args...> fmt, Args&&... args) -> types::Unit {
    detail::Emit(stdout, std::format(fmt, std::forward<Args>(args)...));
  }

  inline fn Print(const StringView text) -> types::Unit {
    detail::Emit(stdout, text);
  }

  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) -> types::Unit {
    detail::Emit(stdout, std::format(fmt, std::forward<Args>(args)...) + "\n");
  }

  inline fn Println(const StringView text) -> types::Unit {
    detail::Emit(stdout, String(text) + "\n");
  }

  inline fn Println() -> types::Unit {
    detail::Emit(stdout, "\n");
  }

  /**
   * @brief Formats and writes one log line to stderr.
   *
   * Timestamps are UTC, like every other time the library reasons about.
   * Debug builds append the call site on a second line.
   */
  template <typename... Args>
  fn LogImpl(const LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) -> types::Unit {
    if (level < GetRuntimeLogLevel())
      return;

    const auto   now     = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    const String message = std::format(fmt, std::forward<Args>(args)...);

    String line = std::format("{} {} {}\n", Colorize(std::format("[{:%T}Z]", now), LogLevelConst::MUTED_COLOR), detail::StyledLevel(level), message);

#ifndef NDEBUG
    const String site = std::format("           ╰──── {}:{}", std::filesystem::path(loc.file_name()).filename().string(), loc.line());
    line += Italic(Colorize(site, LogLevelConst::MUTED_COLOR));
    line += "\n";
#else
    (void)loc;
#endif

    const LockGuard lock(GetLogMutex());
    detail::Emit(stderr, line);
    std::fflush(stderr);
  }

  /**
   * @brief Logs an error value at the place it was created rather than where it is logged.
   *
   * A NimbusError shows its code, and its validation reason when it has one.
   * Exceptions show what().
   */
  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& errorObj) -> types::Unit {
    using Decayed = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<Decayed, error::NimbusError>) {
      if (errorObj.reason)
        LogImpl(level, errorObj.location, "{} ({}: {})", errorObj.message, errorObj.code, magic_enum::enum_name(*errorObj.reason));
      else
        LogImpl(level, errorObj.location, "{} ({})", errorObj.message, errorObj.code);
    } else if constexpr (std::is_base_of_v<types::Exception, Decayed>) {
      LogImpl(level, std::source_location::current(), "{}", errorObj.what());
    } else {
      LogImpl(level, std::source_location::current(), "{}", errorObj.message);
    }
  }
} // namespace nimbus::utils::logging

#define debug_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Error, error_obj)

#define NIMBUS_LOG(level, fmt, ...) \
  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::level, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) NIMBUS_LOG(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  NIMBUS_LOG(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  NIMBUS_LOG(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) NIMBUS_LOG(Error, fmt __VA_OPT__(, ) __VA_ARGS__)
