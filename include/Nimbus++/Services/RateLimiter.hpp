#pragma once

#include <chrono> // std::chrono::{milliseconds, hours, minutes}

#include "../Utils/Clock.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::ratelimit {
  namespace {
    using utils::clock::IClock;
    using utils::clock::TimePoint;

    using utils::types::f64;
    using utils::types::Mutex;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::u32;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::UniquePointer;
    using utils::types::Unit;
    using utils::types::UnorderedMap;
    using utils::types::usize;

    using std::chrono::milliseconds;
  } // namespace

  struct RateLimitStats {
    u32          capacity  = 0;
    u32          remaining = 0;
    u64          consumed  = 0; ///< Tokens handed out since construction.
    u64          rejected  = 0; ///< Requests refused since construction.
    milliseconds timeUntilReset {};
  };

  /**
   * @brief Thread-safe token bucket.
   *
   * Holds at most `capacity` tokens and regains them continuously at
   * capacity/window per millisecond. Starts full. Every operation refills
   * before it reads or changes the token count.
   */
  class TokenBucket {
   public:
    TokenBucket(u32 capacity, milliseconds window, SharedPointer<const IClock> clock = utils::clock::GetSystemClock());

    TokenBucket(const TokenBucket&)                = delete;
    fn operator=(const TokenBucket&)->TokenBucket& = delete;

    /**
     * @brief Takes one token if at least one is available.
     * @return true if the request is admitted.
     */
    fn tryConsume() -> bool;

    /**
     * @brief Whole tokens currently available.
     */
    [[nodiscard]] fn remaining() -> u32;

    /**
     * @brief Time until the bucket is full again at the current refill rate.
     */
    [[nodiscard]] fn timeUntilReset() -> milliseconds;

    [[nodiscard]] fn stats() -> RateLimitStats;

    [[nodiscard]] fn capacity() const -> u32 {
      return m_capacity;
    }

    [[nodiscard]] fn window() const -> milliseconds {
      return m_window;
    }

   private:
    u32                         m_capacity;
    milliseconds                m_window;
    SharedPointer<const IClock> m_clock;

    Mutex     m_mutex;
    f64       m_tokens;
    TimePoint m_lastRefill;
    u64       m_consumed = 0;
    u64       m_rejected = 0;

    fn refillLocked(TimePoint now) -> Unit;
    [[nodiscard]] fn remainingLocked() const -> u32;
    [[nodiscard]] fn timeUntilResetLocked() const -> milliseconds;
  };

  enum class RateLimitLayer : u8 {
    Global,    ///< Process-wide daily quota.
    PerClient, ///< Hourly quota for one client.
    Burst,     ///< Short-window quota for one client.
  };

  struct RateLimitPolicy {
    u32          globalDailyLimit     = 10000;
    u32          perClientHourlyLimit = 100;
    u32          burstLimit           = 10;
    milliseconds burstWindow          = std::chrono::minutes(5);
  };

  /**
   * @struct RateLimitRejection
   * @brief Why a request was refused, and when the refusing layer is full again.
   */
  struct RateLimitRejection {
    RateLimitLayer layer;
    milliseconds   retryAfter;
    String         message;
  };

  /**
   * @brief Three token buckets checked in order: global daily, per-client hourly, per-client burst.
   *
   * A request is admitted only if every layer admits it. Layers that admitted
   * a request before a later layer refused it keep the token they handed out.
   */
  class LayeredRateLimiter {
   public:
    explicit LayeredRateLimiter(RateLimitPolicy policy, SharedPointer<const IClock> clock = utils::clock::GetSystemClock());

    fn admit(const String& clientId) -> Result<Unit, RateLimitRejection>;

    /**
     * @brief Smallest remaining count across the layers that apply to @p clientId.
     */
    [[nodiscard]] fn remainingFor(const String& clientId) -> u32;

    /**
     * @brief Clients that currently hold their own buckets.
     *
     * A client whose buckets have refilled completely is forgotten the next
     * time a new client arrives; fresh buckets for it would be identical.
     */
    [[nodiscard]] fn trackedClients() -> usize;

    [[nodiscard]] fn policy() const -> const RateLimitPolicy& {
      return m_policy;
    }

   private:
    struct ClientBuckets {
      UniquePointer<TokenBucket> hourly;
      UniquePointer<TokenBucket> burst;
    };

    RateLimitPolicy             m_policy;
    SharedPointer<const IClock> m_clock;
    TokenBucket                 m_global;

    Mutex                                              m_clientsMutex;
    UnorderedMap<String, SharedPointer<ClientBuckets>> m_clients;

    fn bucketsFor(const String& clientId) -> SharedPointer<ClientBuckets>;
    fn pruneIdleLocked() -> Unit;
  };

  /**
   * @brief Converts a rejection into the library's RateLimited error.
   */
  fn ToError(const RateLimitRejection& rejection) -> utils::error::NimbusError;
} // namespace nimbus::services::ratelimit
