#include <chrono> // std::chrono::{minutes, year_month_day}

#include <Nimbus++/Services/WeatherRepository.hpp>
#include <Nimbus++/Utils/Clock.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "MockWeatherProvider.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::types;
using namespace nimbus::test;
using namespace std::chrono;
using nimbus::core::Location;
using nimbus::core::WeatherData;
using nimbus::core::WeatherForecast;
using nimbus::services::weather::RepositoryOptions;
using nimbus::services::weather::WeatherRepository;
using nimbus::utils::cache::CacheStats;
using nimbus::utils::clock::ManualClock;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using enum nimbus::utils::error::ValidationReason;

class WeatherRepositoryTest : public Test {
 protected:
  SharedPointer<ManualClock>               m_clock    = std::make_shared<ManualClock>(sys_days(year(2026) / October / 19));
  StrictMock<MockWeatherProvider>*         m_provider = nullptr;
  UniquePointer<WeatherRepository>         m_repository;
  const Location                           m_london   = MakeLocation(At(51.5074, -0.1278), "London", "GB");
  const year_month_day                     m_today    = year(2026) / October / 19;

  fn build(RepositoryOptions options = {}) -> Unit {
    auto provider = std::make_unique<StrictMock<MockWeatherProvider>>();
    m_provider    = provider.get();
    m_repository  = std::make_unique<WeatherRepository>(std::move(provider), options, m_clock);
  }

  void SetUp() override {
    build();
  }
};

TEST_F(WeatherRepositoryTest, LocationLookupsAreCached) {
  EXPECT_CALL(*m_provider, getLocationDetails(At(51.5074, -0.1278)))
    .WillOnce(Return(Result<Location>(m_london)));

  Result<Location> first  = m_repository->getLocationById("51.5074,-0.1278");
  Result<Location> second = m_repository->getLocationById(" 51.5074 , -0.1278 ");

  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first->name, "London");
  EXPECT_EQ(*second, *first);
}

TEST_F(WeatherRepositoryTest, InvalidIdNeverReachesProvider) {
  Result<Location> location = m_repository->getLocationById("51.5074");

  ASSERT_FALSE(location);
  EXPECT_TRUE(location.error().hasReason(MalformedCoordinates));
}

TEST_F(WeatherRepositoryTest, UnknownLocationIsNotFound) {
  EXPECT_CALL(*m_provider, getLocationDetails(_))
    .WillOnce(Return(Err(NimbusError(NotFound, "no results"))));

  Result<Location> location = m_repository->getLocationById("0,0");

  ASSERT_FALSE(location);
  EXPECT_EQ(location.error().code, NotFound);
}

TEST_F(WeatherRepositoryTest, CoordinateFallbackNamesUnknownPlaces) {
  build({ .coordinateFallback = true });

  EXPECT_CALL(*m_provider, getLocationDetails(_))
    .WillOnce(Return(Err(NimbusError(NotFound, "no results"))));

  Result<Location> location = m_repository->getLocationById("10.5,20.25");

  ASSERT_TRUE(location);
  EXPECT_EQ(location->name, "10.5,20.25");
  EXPECT_EQ(location->country, "Unknown");
}

TEST_F(WeatherRepositoryTest, ProviderFailuresBecomeApiUnavailable) {
  EXPECT_CALL(*m_provider, getLocationDetails(_))
    .WillOnce(Return(Err(NimbusError(Timeout, "Request timed out"))))
    .WillOnce(Return(Result<Location>(m_london)));

  Result<Location> failed = m_repository->getLocationById("51.5074,-0.1278");

  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().code, ApiUnavailable);
  EXPECT_EQ(failed.error().message, "Weather service unavailable");

  // Failures are not cached, so the next call goes upstream again.
  EXPECT_TRUE(m_repository->getLocationById("51.5074,-0.1278"));
}

TEST_F(WeatherRepositoryTest, ForecastIsCachedPerDayCount) {
  EXPECT_CALL(*m_provider, getForecast(m_london.coordinates, 5))
    .WillOnce(Return(Result<WeatherForecast>(MakeForecast(m_london, m_today, { 20.0, 25.0, 22.0, 21.0, 19.0 }))));
  EXPECT_CALL(*m_provider, getForecast(m_london.coordinates, 3))
    .WillOnce(Return(Result<WeatherForecast>(MakeForecast(m_london, m_today, { 20.0, 25.0, 22.0 }))));

  EXPECT_TRUE(m_repository->getForecast(m_london, 5));
  EXPECT_TRUE(m_repository->getForecast(m_london, 5));

  Result<WeatherForecast> shorter = m_repository->getForecast(m_london, 3);
  ASSERT_TRUE(shorter);
  EXPECT_EQ(shorter->forecasts.size(), 3);
}

TEST_F(WeatherRepositoryTest, ForecastExpiresAfterItsTtl) {
  build({ .forecast = { .ttl = minutes(60), .maxEntries = 10 } });

  EXPECT_CALL(*m_provider, getForecast(_, 5))
    .Times(2)
    .WillRepeatedly(Return(Result<WeatherForecast>(MakeForecast(m_london, m_today, { 20.0, 25.0 }))));

  EXPECT_TRUE(m_repository->getForecast(m_london, 5));
  m_clock->advance(minutes(30));
  EXPECT_TRUE(m_repository->getForecast(m_london, 5));
  m_clock->advance(minutes(31));
  EXPECT_TRUE(m_repository->getForecast(m_london, 5));
}

TEST_F(WeatherRepositoryTest, ForecastKeepsTheCallersLocation) {
  const Location upstreamName = MakeLocation(m_london.coordinates, "City of London", "GB");

  EXPECT_CALL(*m_provider, getForecast(_, _))
    .WillOnce(Return(Result<WeatherForecast>(MakeForecast(upstreamName, m_today, { 20.0 }))));

  Result<WeatherForecast> forecast = m_repository->getForecast(m_london, 5);

  ASSERT_TRUE(forecast);
  EXPECT_EQ(forecast->location.name, "London");
}

TEST_F(WeatherRepositoryTest, EmptyForecastIsNotFound) {
  EXPECT_CALL(*m_provider, getForecast(_, _))
    .WillOnce(Return(Result<WeatherForecast>(WeatherForecast { .location = m_london, .forecasts = {} })));

  Result<WeatherForecast> forecast = m_repository->getForecast(m_london, 5);

  ASSERT_FALSE(forecast);
  EXPECT_EQ(forecast.error().code, NotFound);
}

TEST_F(WeatherRepositoryTest, CurrentWeatherIsCached) {
  const WeatherData current {
    .location    = m_london,
    .timestamp   = m_clock->now(),
    .temperature = *nimbus::core::Temperature::FromCelsius(18.0),
    .description = "light rain",
    .humidity    = 80.0,
    .windSpeed   = 4.1,
    .pressure    = 1008.0,
  };

  EXPECT_CALL(*m_provider, getCurrentWeather(m_london.coordinates))
    .WillOnce(Return(Result<WeatherData>(current)));

  EXPECT_TRUE(m_repository->getCurrentWeather(m_london));

  Result<WeatherData> cached = m_repository->getCurrentWeather(m_london);
  ASSERT_TRUE(cached);
  EXPECT_EQ(cached->description, "light rain");

  const Array<CacheStats, 3> stats = m_repository->cacheStats();
  EXPECT_EQ(stats[0].name, "weather");
  EXPECT_EQ(stats[0].hits, 1);
  EXPECT_EQ(stats[0].misses, 1);
}

TEST_F(WeatherRepositoryTest, BatchLookupSkipsFailures) {
  const Location paris = MakeLocation(At(48.8566, 2.3522), "Paris", "FR");

  EXPECT_CALL(*m_provider, getLocationDetails(At(51.5074, -0.1278)))
    .WillOnce(Return(Result<Location>(m_london)));
  EXPECT_CALL(*m_provider, getLocationDetails(At(48.8566, 2.3522)))
    .WillOnce(Return(Result<Location>(paris)));

  const Vec<String> ids = { "51.5074,-0.1278", "not-a-coordinate", "48.8566,2.3522" };

  const Vec<Location> locations = m_repository->getLocationsByIds(ids);

  ASSERT_EQ(locations.size(), 2);
  EXPECT_EQ(locations[0].name, "London");
  EXPECT_EQ(locations[1].name, "Paris");
}

TEST_F(WeatherRepositoryTest, InvalidateAllForcesReload) {
  EXPECT_CALL(*m_provider, getLocationDetails(_))
    .Times(2)
    .WillRepeatedly(Return(Result<Location>(m_london)));

  EXPECT_TRUE(m_repository->getLocationById("51.5074,-0.1278"));
  m_repository->invalidateAll();
  EXPECT_TRUE(m_repository->getLocationById("51.5074,-0.1278"));
}
