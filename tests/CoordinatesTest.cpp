#include <format> // std::format
#include <limits> // std::numeric_limits

#include <Nimbus++/Core/Coordinates.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using nimbus::core::Coordinates;
using enum nimbus::utils::error::NimbusErrorCode;
using enum nimbus::utils::error::ValidationReason;

class CoordinatesTest : public testing::Test {};

TEST_F(CoordinatesTest, ParsesLatLonPair) {
  Result<Coordinates> coords = Coordinates::Parse("51.5074,-0.1278");

  ASSERT_TRUE(coords) << coords.error().message;
  EXPECT_DOUBLE_EQ(coords->latitude(), 51.5074);
  EXPECT_DOUBLE_EQ(coords->longitude(), -0.1278);
}

TEST_F(CoordinatesTest, IgnoresSurroundingWhitespace) {
  Result<Coordinates> coords = Coordinates::Parse("  40.7128 , -74.0060 ");

  ASSERT_TRUE(coords);
  EXPECT_DOUBLE_EQ(coords->latitude(), 40.7128);
  EXPECT_DOUBLE_EQ(coords->longitude(), -74.006);
}

TEST_F(CoordinatesTest, AcceptsBoundaryValues) {
  EXPECT_TRUE(Coordinates::Create(90.0, 180.0));
  EXPECT_TRUE(Coordinates::Create(-90.0, -180.0));
  EXPECT_TRUE(Coordinates::Parse("0,0"));
}

TEST_F(CoordinatesTest, RejectsLatitudeOutOfRange) {
  Result<Coordinates> coords = Coordinates::Parse("91,0");

  ASSERT_FALSE(coords);
  EXPECT_EQ(coords.error().code, InvalidArgument);
  EXPECT_TRUE(coords.error().hasReason(LatitudeOutOfRange));
}

TEST_F(CoordinatesTest, RejectsLongitudeOutOfRange) {
  Result<Coordinates> coords = Coordinates::Create(10.0, -180.5);

  ASSERT_FALSE(coords);
  EXPECT_TRUE(coords.error().hasReason(LongitudeOutOfRange));
}

TEST_F(CoordinatesTest, RejectsNaN) {
  EXPECT_FALSE(Coordinates::Create(std::numeric_limits<f64>::quiet_NaN(), 0.0));
  EXPECT_FALSE(Coordinates::Parse("nan,0"));
}

TEST_F(CoordinatesTest, RejectsMalformedStrings) {
  for (const StringView text : { "51.5074", "51.5074,", "abc,def", "1,2,3", "", "12,3x" }) {
    Result<Coordinates> coords = Coordinates::Parse(text);

    ASSERT_FALSE(coords) << "accepted '" << text << "'";
    EXPECT_TRUE(coords.error().hasReason(MalformedCoordinates)) << text;
  }
}

TEST_F(CoordinatesTest, ToStringRoundTrips) {
  Result<Coordinates> original = Coordinates::Create(35.6762, 139.6503);
  ASSERT_TRUE(original);

  EXPECT_EQ(original->toString(), "35.6762,139.6503");

  Result<Coordinates> reparsed = Coordinates::Parse(original->toString());
  ASSERT_TRUE(reparsed);
  EXPECT_EQ(*reparsed, *original);
}

TEST_F(CoordinatesTest, FormatterMatchesToString) {
  Result<Coordinates> coords = Coordinates::Create(-33.8688, 151.2093);
  ASSERT_TRUE(coords);

  EXPECT_EQ(std::format("{}", *coords), coords->toString());
}

TEST_F(CoordinatesTest, ParseMultipleSplitsIntoPairs) {
  Result<Vec<Coordinates>> list = Coordinates::ParseMultiple("51.5074,-0.1278, 48.8566,2.3522");

  ASSERT_TRUE(list);
  ASSERT_EQ(list->size(), 2);
  EXPECT_DOUBLE_EQ((*list)[1].latitude(), 48.8566);
  EXPECT_DOUBLE_EQ((*list)[1].longitude(), 2.3522);
}

TEST_F(CoordinatesTest, ParseMultipleDropsEmptyTokens) {
  Result<Vec<Coordinates>> list = Coordinates::ParseMultiple(",51.5074,,-0.1278,");

  ASSERT_TRUE(list);
  EXPECT_EQ(list->size(), 1);
}

TEST_F(CoordinatesTest, ParseMultipleRejectsOddCount) {
  Result<Vec<Coordinates>> list = Coordinates::ParseMultiple("51.5074");

  ASSERT_FALSE(list);
  EXPECT_TRUE(list.error().hasReason(OddCoordinateCount));
}

TEST_F(CoordinatesTest, ParseMultipleRejectsEmptyList) {
  Result<Vec<Coordinates>> list = Coordinates::ParseMultiple(" , ");

  ASSERT_FALSE(list);
  EXPECT_TRUE(list.error().hasReason(MissingParameter));
}

TEST_F(CoordinatesTest, ParseMultipleFailsOnAnyInvalidPair) {
  Result<Vec<Coordinates>> list = Coordinates::ParseMultiple("51.5074,-0.1278,95,0");

  ASSERT_FALSE(list);
  EXPECT_TRUE(list.error().hasReason(LatitudeOutOfRange));
}
