#include <chrono> // std::chrono::{year_month_day, October}
#include <limits> // std::numeric_limits

#include <Nimbus++/Core/Coordinates.hpp>
#include <Nimbus++/Core/Entities.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "Services/Weather/DataTransferObjects.hpp" // glz::{read, format_error}
#include "Services/Weather/WeatherUtils.hpp"

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using namespace std::chrono;
using nimbus::core::Coordinates;
using nimbus::core::DailyForecast;

namespace owm     = nimbus::services::weather::dto::owm;
namespace helpers = nimbus::services::weather::helpers;

namespace {
  // Five three-hour slots: 00:00, 12:00 and 21:00 UTC on 2026-10-19, then 00:00 and 03:00 UTC on the 20th.
  constexpr StringView FORECAST_JSON = R"json({
    "cod": "200",
    "cnt": 5,
    "list": [
      { "dt": 1792368000, "main": { "temp": 12.0, "temp_min": 10.0, "temp_max": 15.0, "pressure": 1012, "humidity": 70 },
        "weather": [{ "id": 803, "main": "Clouds", "description": "clouds" }], "wind": { "speed": 2.0, "deg": 200 } },
      { "dt": 1792411200, "main": { "temp": 18.0, "temp_min": 12.0, "temp_max": 20.0, "pressure": 1010, "humidity": 50 },
        "weather": [{ "id": 800, "main": "Clear", "description": "clear sky" }], "wind": { "speed": 4.0, "deg": 210 } },
      { "dt": 1792443600, "main": { "temp": 11.0, "temp_min": 9.0, "temp_max": 14.0, "pressure": 1011, "humidity": 60 },
        "weather": [{ "id": 803, "main": "Clouds", "description": "clouds" }], "wind": { "speed": 3.0, "deg": 220 } },
      { "dt": 1792454400, "main": { "temp": 10.0, "temp_min": 8.0, "temp_max": 13.0, "pressure": 1009, "humidity": 80 },
        "weather": [{ "id": 500, "main": "Rain", "description": "rain" }], "wind": { "speed": 5.0, "deg": 230 } },
      { "dt": 1792465200, "main": { "temp": 9.0, "temp_min": 7.0, "temp_max": 16.0, "pressure": 1008, "humidity": 90 },
        "weather": [{ "id": 300, "main": "Drizzle", "description": "drizzle" }], "wind": { "speed": 6.0, "deg": 240 } }
    ],
    "city": { "id": 2643743, "name": "London", "country": "GB", "timezone": 3600 }
  })json";

  fn ParseForecast() -> owm::ForecastResponse {
    owm::ForecastResponse response;
    String                buffer(FORECAST_JSON);

    const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(response, buffer);

    EXPECT_EQ(errc.ec, glz::error_code::none) << glz::format_error(errc, buffer);

    return response;
  }

  fn At(const f64 latitude, const f64 longitude) -> Coordinates {
    return *Coordinates::Create(latitude, longitude);
  }
} // namespace

class WeatherUtilsTest : public testing::Test {};

TEST_F(WeatherUtilsTest, ForecastResponseParsesAndSkipsUnknownKeys) {
  const owm::ForecastResponse response = ParseForecast();

  ASSERT_EQ(response.list.size(), 5);
  EXPECT_EQ(response.city.name, "London");
  EXPECT_EQ(response.city.country, "GB");
  EXPECT_DOUBLE_EQ(response.list[1].main.tempMax, 20.0);
  EXPECT_EQ(response.list[1].weather.front().description, "clear sky");
}

TEST_F(WeatherUtilsTest, GeocodeResponseParses) {
  String buffer = R"json([{ "name": "London", "local_names": { "en": "London" }, "lat": 51.5073219, "lon": -0.1276474, "country": "GB", "state": "England" }])json";

  Vec<owm::GeocodeEntry> entries;

  const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(entries, buffer);

  ASSERT_EQ(errc.ec, glz::error_code::none) << glz::format_error(errc, buffer);
  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].state, "England");
  EXPECT_DOUBLE_EQ(entries[0].lat, 51.5073219);
}

TEST_F(WeatherUtilsTest, ErrorResponseMessageIsOptional) {
  String             buffer = R"json({ "cod": 401 })json";
  owm::ErrorResponse body;

  const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(body, buffer);

  ASSERT_EQ(errc.ec, glz::error_code::none);
  EXPECT_FALSE(body.message);
}

TEST_F(WeatherUtilsTest, GroupsSlotsIntoLocalDays) {
  const owm::ForecastResponse response = ParseForecast();

  Result<Vec<DailyForecast>> days = helpers::AggregateDailyForecasts(response.list, At(51.5074, -0.1278), 5);

  ASSERT_TRUE(days) << days.error().message;
  ASSERT_EQ(days->size(), 2);

  const DailyForecast& first = (*days)[0];
  EXPECT_EQ(first.date, year(2026) / October / 19);
  EXPECT_DOUBLE_EQ(first.temperatureMin.toCelsius(), 9.0);
  EXPECT_DOUBLE_EQ(first.temperatureMax.toCelsius(), 20.0);
  EXPECT_DOUBLE_EQ(first.humidity, 60.0);
  EXPECT_DOUBLE_EQ(first.windSpeed, 3.0);
  EXPECT_DOUBLE_EQ(first.pressure, 1012.0);
  EXPECT_EQ(first.description, "clouds");

  const DailyForecast& second = (*days)[1];
  EXPECT_EQ(second.date, year(2026) / October / 20);
  EXPECT_DOUBLE_EQ(second.temperatureMin.toCelsius(), 7.0);
  EXPECT_DOUBLE_EQ(second.temperatureMax.toCelsius(), 16.0);
  EXPECT_EQ(second.description, "rain");
}

TEST_F(WeatherUtilsTest, LocalDateShiftsWithLongitude) {
  const owm::ForecastResponse response = ParseForecast();

  // In Tokyo (UTC+9) the 21:00 UTC slot already belongs to the 20th.
  Result<Vec<DailyForecast>> days = helpers::AggregateDailyForecasts(response.list, At(35.6762, 139.6917), 5);

  ASSERT_TRUE(days);
  ASSERT_EQ(days->size(), 2);
  EXPECT_DOUBLE_EQ((*days)[0].temperatureMin.toCelsius(), 10.0);
  EXPECT_DOUBLE_EQ((*days)[1].temperatureMin.toCelsius(), 7.0);
  EXPECT_DOUBLE_EQ((*days)[1].temperatureMax.toCelsius(), 16.0);
}

TEST_F(WeatherUtilsTest, KeepsOnlyRequestedDays) {
  const owm::ForecastResponse response = ParseForecast();

  Result<Vec<DailyForecast>> days = helpers::AggregateDailyForecasts(response.list, At(51.5074, -0.1278), 1);

  ASSERT_TRUE(days);
  ASSERT_EQ(days->size(), 1);
  EXPECT_EQ(days->front().date, year(2026) / October / 19);
}

TEST_F(WeatherUtilsTest, SlotCountStaysWithinOneToFiveDays) {
  EXPECT_EQ(helpers::ForecastSlotCount(0), 8);
  EXPECT_EQ(helpers::ForecastSlotCount(2), 16);
  EXPECT_EQ(helpers::ForecastSlotCount(5), 40);
  EXPECT_EQ(helpers::ForecastSlotCount(6), 40);

  // 0x20000001 * 8 wraps to 8 in 32 bits.
  EXPECT_EQ(helpers::ForecastSlotCount(0x20000001U), 40);
  EXPECT_EQ(helpers::ForecastSlotCount(std::numeric_limits<u32>::max()), 40);
}

TEST_F(WeatherUtilsTest, EmptyListGivesNoDays) {
  Result<Vec<DailyForecast>> days = helpers::AggregateDailyForecasts({}, At(0.0, 0.0), 5);

  ASSERT_TRUE(days);
  EXPECT_TRUE(days->empty());
}

TEST_F(WeatherUtilsTest, ImpossibleTemperatureIsAnError) {
  owm::ForecastResponse response = ParseForecast();
  response.list[0].main.tempMin  = -400.0;

  EXPECT_FALSE(helpers::AggregateDailyForecasts(response.list, At(51.5074, -0.1278), 5));
}

TEST_F(WeatherUtilsTest, MostFrequentPrefersEarliestOnTie) {
  const Vec<String> values = { "rain", "clouds", "clouds", "rain", "sun" };

  EXPECT_EQ(helpers::MostFrequent(values), "rain");
  EXPECT_EQ(helpers::MostFrequent(Vec<String> { "sun", "fog", "fog" }), "fog");
  EXPECT_EQ(helpers::MostFrequent(Vec<String> {}), "");
}

TEST_F(WeatherUtilsTest, FirstDescriptionDefaultsToUnknown) {
  EXPECT_EQ(helpers::FirstDescription({}), "unknown");
  EXPECT_EQ(helpers::FirstDescription({ owm::Condition { .description = "mist" } }), "mist");
}
