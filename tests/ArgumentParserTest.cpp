#include <Nimbus++/Utils/ArgumentParser.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using nimbus::utils::argparse::ArgumentParser;
using nimbus::utils::argparse::ParseOutcome;
using nimbus::utils::logging::LogLevel;
using enum nimbus::utils::error::NimbusErrorCode;

class ArgumentParserTest : public testing::Test {
 protected:
  ArgumentParser m_parser { "nimbus", "0.1.0" };

  void SetUp() override {
    m_parser.addArguments("--locations").help("Coordinates");
    m_parser.addArguments("--unit").choices({ "celsius", "c", "fahrenheit", "f" });
    m_parser.addArguments("--client").defaultValue(String("cli"));
    m_parser.addArguments("--json").flag();
    m_parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Info);
  }
};

TEST_F(ArgumentParserTest, ParsesValuesAndFlags) {
  Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--locations", "51.5,-0.12", "--json" });

  ASSERT_TRUE(outcome);
  EXPECT_EQ(*outcome, ParseOutcome::Run);
  EXPECT_EQ(m_parser.get<String>("--locations"), "51.5,-0.12");
  EXPECT_TRUE(m_parser.get<bool>("--json"));
  EXPECT_TRUE(m_parser.isUsed("--json"));
}

TEST_F(ArgumentParserTest, DefaultsApplyWhenOmitted) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus" }));

  EXPECT_EQ(m_parser.get<String>("--client"), "cli");
  EXPECT_FALSE(m_parser.get<bool>("--json"));
  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Info);
}

TEST_F(ArgumentParserTest, GetOptionalOnlyReportsGivenValues) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "--unit", "f" }));

  EXPECT_EQ(m_parser.getOptional("--unit"), "f");
  EXPECT_FALSE(m_parser.getOptional("--client"));
  EXPECT_FALSE(m_parser.getOptional("--locations"));
}

TEST_F(ArgumentParserTest, AliasesShareOneArgument) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "-l", "debug" }));

  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Debug);
}

TEST_F(ArgumentParserTest, RejectsValueOutsideChoices) {
  Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--unit", "kelvin" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, ChoicesIgnoreCase) {
  EXPECT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "--unit", "Celsius" }));
}

TEST_F(ArgumentParserTest, RejectsUnknownArgument) {
  Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--colour" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().message, "Unknown argument: --colour");
}

TEST_F(ArgumentParserTest, RejectsMissingValue) {
  Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--locations" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().message, "Argument --locations requires a value");
}

TEST_F(ArgumentParserTest, HelpAndVersionStopParsing) {
  EXPECT_EQ(m_parser.parseArgs(Vec<String> { "nimbus", "--help", "--bogus" }), ParseOutcome::HelpShown);
  EXPECT_EQ(m_parser.parseArgs(Vec<String> { "nimbus", "-v" }), ParseOutcome::VersionShown);
}
