#include <atomic> // std::atomic
#include <chrono> // std::chrono::{hours, minutes, seconds}
#include <thread> // std::thread

#include <Nimbus++/Services/RateLimiter.hpp>
#include <Nimbus++/Utils/Clock.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using namespace nimbus::services::ratelimit;
using nimbus::utils::clock::ManualClock;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::minutes;

class TokenBucketTest : public testing::Test {
 protected:
  SharedPointer<ManualClock> m_clock = std::make_shared<ManualClock>();
};

TEST_F(TokenBucketTest, StartsFullAndAdmitsExactlyCapacity) {
  TokenBucket bucket(5, hours(24), m_clock);

  EXPECT_EQ(bucket.remaining(), 5);

  for (i32 i = 0; i < 5; ++i)
    EXPECT_TRUE(bucket.tryConsume()) << "request " << i;

  EXPECT_FALSE(bucket.tryConsume());
  EXPECT_EQ(bucket.remaining(), 0);
}

TEST_F(TokenBucketTest, RefillsProportionallyToElapsedTime) {
  TokenBucket bucket(24, hours(24), m_clock);

  for (i32 i = 0; i < 24; ++i)
    ASSERT_TRUE(bucket.tryConsume());

  m_clock->advance(hours(1));
  EXPECT_EQ(bucket.remaining(), 1);

  m_clock->advance(minutes(150));
  EXPECT_EQ(bucket.remaining(), 3);
}

TEST_F(TokenBucketTest, NeverExceedsCapacity) {
  TokenBucket bucket(3, hours(1), m_clock);

  m_clock->advance(hours(48));

  EXPECT_EQ(bucket.remaining(), 3);
}

TEST_F(TokenBucketTest, TimeUntilResetShrinksAsTokensReturn) {
  TokenBucket bucket(10, minutes(10), m_clock);

  EXPECT_EQ(bucket.timeUntilReset(), milliseconds(0));

  for (i32 i = 0; i < 10; ++i)
    ASSERT_TRUE(bucket.tryConsume());

  EXPECT_EQ(bucket.timeUntilReset(), minutes(10));

  m_clock->advance(minutes(4));
  EXPECT_EQ(bucket.timeUntilReset(), minutes(6));
}

TEST_F(TokenBucketTest, StatsCountConsumedAndRejected) {
  TokenBucket bucket(1, hours(1), m_clock);

  EXPECT_TRUE(bucket.tryConsume());
  EXPECT_FALSE(bucket.tryConsume());
  EXPECT_FALSE(bucket.tryConsume());

  const RateLimitStats stats = bucket.stats();
  EXPECT_EQ(stats.capacity, 1);
  EXPECT_EQ(stats.remaining, 0);
  EXPECT_EQ(stats.consumed, 1);
  EXPECT_EQ(stats.rejected, 2);
}

TEST_F(TokenBucketTest, ZeroCapacityRejectsEverything) {
  TokenBucket bucket(0, hours(1), m_clock);

  EXPECT_FALSE(bucket.tryConsume());
  m_clock->advance(hours(2));
  EXPECT_FALSE(bucket.tryConsume());
}

TEST_F(TokenBucketTest, ConcurrentConsumersNeverOverdraw) {
  constexpr u32 capacity = 100;

  TokenBucket bucket(capacity, hours(24), m_clock);

  std::atomic<u32> admitted = 0;
  Vec<std::thread> workers;

  for (i32 thread = 0; thread < 8; ++thread)
    workers.emplace_back([&] {
      for (i32 i = 0; i < 50; ++i)
        if (bucket.tryConsume())
          admitted.fetch_add(1);
    });

  for (std::thread& worker : workers)
    worker.join();

  EXPECT_EQ(admitted.load(), capacity);
  EXPECT_EQ(bucket.stats().rejected, 8 * 50 - capacity);
}

class LayeredRateLimiterTest : public testing::Test {
 protected:
  SharedPointer<ManualClock> m_clock = std::make_shared<ManualClock>();
};

TEST_F(LayeredRateLimiterTest, BurstLayerTripsFirst) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 50, .burstLimit = 3, .burstWindow = minutes(5) }, m_clock);

  for (i32 i = 0; i < 3; ++i)
    EXPECT_TRUE(limiter.admit("alice"));

  Result<Unit, RateLimitRejection> rejected = limiter.admit("alice");

  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().layer, RateLimitLayer::Burst);
  EXPECT_EQ(rejected.error().message, "Burst protection triggered: too many requests in a short time");
  EXPECT_GT(rejected.error().retryAfter, milliseconds(0));
}

TEST_F(LayeredRateLimiterTest, ClientsAreIndependent) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 50, .burstLimit = 1, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_FALSE(limiter.admit("alice"));
  EXPECT_TRUE(limiter.admit("bob"));
}

TEST_F(LayeredRateLimiterTest, HourlyLayerRejectsAfterBurstRecovers) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 2, .burstLimit = 10, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_TRUE(limiter.admit("alice"));

  Result<Unit, RateLimitRejection> rejected = limiter.admit("alice");

  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().layer, RateLimitLayer::PerClient);
  EXPECT_EQ(rejected.error().message, "Rate limited: hourly limit reached for this client");
}

TEST_F(LayeredRateLimiterTest, GlobalLayerAppliesAcrossClients) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 2, .perClientHourlyLimit = 10, .burstLimit = 10, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_TRUE(limiter.admit("bob"));

  Result<Unit, RateLimitRejection> rejected = limiter.admit("carol");

  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().layer, RateLimitLayer::Global);
}

TEST_F(LayeredRateLimiterTest, BurstWindowRecovers) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 50, .burstLimit = 1, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_FALSE(limiter.admit("alice"));

  m_clock->advance(minutes(5));

  EXPECT_TRUE(limiter.admit("alice"));
}

TEST_F(LayeredRateLimiterTest, RemainingIsTheTightestLayer) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 50, .burstLimit = 4, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));

  EXPECT_EQ(limiter.remainingFor("alice"), 3);
  EXPECT_EQ(limiter.remainingFor("bob"), 4);
}

TEST_F(LayeredRateLimiterTest, RefilledClientsAreForgotten) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 5, .burstLimit = 2, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_TRUE(limiter.admit("bob"));
  EXPECT_EQ(limiter.trackedClients(), 2);

  // Both hourly buckets are full again after an hour.
  m_clock->advance(hours(1));

  EXPECT_TRUE(limiter.admit("carol"));
  EXPECT_EQ(limiter.trackedClients(), 1);
}

TEST_F(LayeredRateLimiterTest, ClientsStillRefillingAreKept) {
  LayeredRateLimiter limiter({ .globalDailyLimit = 100, .perClientHourlyLimit = 5, .burstLimit = 10, .burstWindow = minutes(5) }, m_clock);

  EXPECT_TRUE(limiter.admit("alice"));
  EXPECT_TRUE(limiter.admit("alice"));

  m_clock->advance(minutes(10));

  EXPECT_TRUE(limiter.admit("bob"));
  EXPECT_EQ(limiter.trackedClients(), 2);

  // alice's hourly bucket still remembers both requests.
  EXPECT_EQ(limiter.remainingFor("alice"), 3);
}

TEST_F(LayeredRateLimiterTest, RejectionConvertsToRateLimitedError) {
  const NimbusError error = ToError({ .layer = RateLimitLayer::Burst, .retryAfter = milliseconds(1500), .message = "Burst protection triggered: too many requests in a short time" });

  EXPECT_EQ(error.code, RateLimited);
  EXPECT_EQ(error.message, "Burst protection triggered: too many requests in a short time (retry in 2s)");
}
