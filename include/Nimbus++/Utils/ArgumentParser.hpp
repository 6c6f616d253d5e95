/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for Nimbus++.
 *
 * Supports flags, valued options with defaults, enum-backed choices (via
 * magic_enum) and help text generation. Help and version requests are
 * reported back to the caller instead of terminating the process.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace nimbus::utils::argparse {
  namespace {
    using error::NimbusError;
    using error::NimbusErrorCode;
    using logging::Println;

    using types::Err;
    using types::Map;
    using types::None;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;
  } // namespace

  using ArgValue   = std::variant<bool, String>;
  using ArgChoices = Vec<String>;

  /**
   * @brief What the caller should do after a successful parse.
   */
  enum class ParseOutcome : u8 {
    Run,         ///< Proceed normally.
    HelpShown,   ///< Help text was printed; exit successfully.
    VersionShown ///< Version was printed; exit successfully.
  };

  namespace detail {
    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return text;
    }
  } // namespace detail

  /**
   * @brief String conversion for scoped enums used as argument values.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> Option<EnumType> {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (detail::EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return None;
    }

    static fn enumToString(const EnumType value) -> String {
      return String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief One command-line option and its aliases.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    fn defaultValue(String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Sets an enum default and restricts accepted values to the enum's names.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    /**
     * @brief Returns the given value, the default, or a value-initialised T.
     */
    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    /**
     * @brief Returns the value only if it was given on the command line.
     */
    [[nodiscard]] fn given() const -> Option<String> {
      if (m_value && std::holds_alternative<String>(*m_value))
        return std::get<String>(*m_value);

      return None;
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_value.has_value();
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.front();
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn getChoices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    fn setValue(String value) -> Result<> {
      if (m_choices) {
        const bool isValid = std::ranges::any_of(*m_choices, [&](const String& choice) { return detail::EqualsIgnoreCase(value, choice); });

        if (!isValid) {
          std::ostringstream allowed;

          for (usize i = 0; i < m_choices->size(); ++i)
            allowed << (i > 0 ? ", " : "") << detail::ToLower((*m_choices)[i]);

          ERR_FMT(NimbusErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", value, getPrimaryName(), allowed.str());
        }
      }

      m_value = std::move(value);
      return {};
    }

    fn markUsed() -> Unit {
      m_value = true;
    }

   private:
    Vec<String>        m_names;
    String             m_helpText;
    Option<ArgValue>   m_value;
    Option<ArgValue>   m_defaultValue;
    Option<ArgChoices> m_choices;
    bool               m_isFlag = false;
  };

  class ArgumentParser {
   public:
    explicit ArgumentParser(String programName, String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    /**
     * @brief Registers an argument under one or more aliases.
     * @return The new argument, for chained configuration.
     */
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    fn parseArgs(const Span<const char* const> args) -> Result<ParseOutcome> {
      Vec<String> stringArgs;
      stringArgs.reserve(args.size());

      for (const char* arg : args)
        stringArgs.emplace_back(arg);

      return parseArgs(stringArgs);
    }

    /**
     * @brief Parses arguments; element 0 is the program name and is skipped.
     */
    fn parseArgs(const Vec<String>& args) -> Result<ParseOutcome> {
      for (usize i = 1; i < args.size(); ++i) {
        const String& arg = args[i];

        if (arg == "-h" || arg == "--help") {
          printHelp();
          return ParseOutcome::HelpShown;
        }

        if (arg == "-v" || arg == "--version") {
          Println(m_version);
          return ParseOutcome::VersionShown;
        }

        const auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          ERR_FMT(NimbusErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(NimbusErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        if (Result res = argument->setValue(args[++i]); !res)
          return Err(res.error());
      }

      return ParseOutcome::Run;
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      if (const Argument* arg = find(name))
        return arg->get<T>();

      return T {};
    }

    /**
     * @brief Returns an option's value only if the user supplied it.
     */
    [[nodiscard]] fn getOptional(const StringView name) const -> Option<String> {
      if (const Argument* arg = find(name))
        return arg->given();

      return None;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] fn getEnum(const StringView name) const -> Option<EnumType> {
      return EnumTraits<EnumType>::stringToEnum(get<String>(name));
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      const Argument* arg = find(name);
      return arg && arg->isUsed();
    }

    fn printHelp() const -> Unit {
      std::ostringstream usage;
      usage << "Usage: " << m_programName;

      for (const UniquePointer<Argument>& arg : m_arguments)
        usage << " [" << arg->getPrimaryName() << (arg->isFlag() ? "" : " VALUE") << "]";

      Println(usage.str());
      Println();
      Println("Arguments:");

      for (const UniquePointer<Argument>& arg : m_arguments) {
        std::ostringstream line;
        line << "  ";

        for (usize i = 0; i < arg->getNames().size(); ++i)
          line << (i > 0 ? ", " : "") << arg->getNames()[i];

        if (!arg->isFlag())
          line << " VALUE";

        Println(line.str());

        if (!arg->getHelpText().empty())
          Println("    {}", arg->getHelpText());

        if (const Option<ArgChoices>& choices = arg->getChoices()) {
          std::ostringstream values;

          for (usize i = 0; i < choices->size(); ++i)
            values << (i > 0 ? ", " : "") << detail::ToLower((*choices)[i]);

          Println("    Available values: {}", values.str());
        }
      }
    }

   private:
    String                       m_programName;
    String                       m_version;
    Vec<UniquePointer<Argument>> m_arguments;
    Map<String, Argument*>       m_argumentMap;

    [[nodiscard]] fn find(const StringView name) const -> const Argument* {
      const auto iter = m_argumentMap.find(String(name));
      return iter == m_argumentMap.end() ? nullptr : iter->second;
    }
  };
} // namespace nimbus::utils::argparse
