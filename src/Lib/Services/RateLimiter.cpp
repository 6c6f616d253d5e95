#include "Nimbus++/Services/RateLimiter.hpp"

#include <algorithm>     // std::{min, max}
#include <cmath>         // std::{ceil, floor}
#include <format>        // std::format
#include <memory>        // std::{make_shared, make_unique}
#include <unordered_map> // std::erase_if

#include "Nimbus++/Utils/Logging.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::clock::IClock;
using nimbus::utils::clock::TimePoint;
using nimbus::utils::error::NimbusError;
using std::chrono::milliseconds;

namespace {
  // Absorbs rounding in repeated fractional refills so a bucket that has
  // regained exactly N tokens never reads as N-1.
  constexpr f64 TOKEN_EPSILON = 1e-9;
} // namespace

namespace nimbus::services::ratelimit {
  TokenBucket::TokenBucket(const u32 capacity, const milliseconds window, SharedPointer<const IClock> clock)
    : m_capacity(capacity),
      m_window(std::max(window, milliseconds(1))),
      m_clock(std::move(clock)),
      m_tokens(static_cast<f64>(capacity)),
      m_lastRefill(m_clock->now()) {}

  fn TokenBucket::refillLocked(const TimePoint now) -> Unit {
    if (now <= m_lastRefill)
      return;

    const f64 elapsedMs = std::chrono::duration<f64, std::milli>(now - m_lastRefill).count();

    m_tokens     = std::min(static_cast<f64>(m_capacity), m_tokens + (elapsedMs * m_capacity / static_cast<f64>(m_window.count())));
    m_lastRefill = now;
  }

  fn TokenBucket::remainingLocked() const -> u32 {
    return static_cast<u32>(std::floor(m_tokens + TOKEN_EPSILON));
  }

  fn TokenBucket::timeUntilResetLocked() const -> milliseconds {
    if (m_capacity == 0)
      return milliseconds(0);

    const f64 missing = static_cast<f64>(m_capacity) - m_tokens;

    if (missing <= TOKEN_EPSILON)
      return milliseconds(0);

    return milliseconds(static_cast<i64>(std::ceil(missing * static_cast<f64>(m_window.count()) / m_capacity)));
  }

  fn TokenBucket::tryConsume() -> bool {
    const LockGuard lock(m_mutex);

    refillLocked(m_clock->now());

    if (m_tokens + TOKEN_EPSILON < 1.0) {
      ++m_rejected;
      return false;
    }

    m_tokens = std::max(0.0, m_tokens - 1.0);
    ++m_consumed;

    return true;
  }

  fn TokenBucket::remaining() -> u32 {
    const LockGuard lock(m_mutex);
    refillLocked(m_clock->now());
    return remainingLocked();
  }

  fn TokenBucket::timeUntilReset() -> milliseconds {
    const LockGuard lock(m_mutex);
    refillLocked(m_clock->now());
    return timeUntilResetLocked();
  }

  fn TokenBucket::stats() -> RateLimitStats {
    const LockGuard lock(m_mutex);
    refillLocked(m_clock->now());

    return {
      .capacity       = m_capacity,
      .remaining      = remainingLocked(),
      .consumed       = m_consumed,
      .rejected       = m_rejected,
      .timeUntilReset = timeUntilResetLocked(),
    };
  }

  LayeredRateLimiter::LayeredRateLimiter(RateLimitPolicy policy, SharedPointer<const IClock> clock)
    : m_policy(policy),
      m_clock(std::move(clock)),
      m_global(m_policy.globalDailyLimit, std::chrono::hours(24), m_clock) {}

  fn LayeredRateLimiter::pruneIdleLocked() -> Unit {
    // Only buckets nobody else holds are dropped, so an in-flight admit never
    // consumes from a pair that has already been replaced.
    std::erase_if(m_clients, [](const auto& entry) {
      const SharedPointer<ClientBuckets>& buckets = entry.second;

      return buckets.use_count() == 1 && buckets->hourly->timeUntilReset() == milliseconds(0) &&
        buckets->burst->timeUntilReset() == milliseconds(0);
    });
  }

  fn LayeredRateLimiter::bucketsFor(const String& clientId) -> SharedPointer<ClientBuckets> {
    const LockGuard lock(m_clientsMutex);

    if (auto iter = m_clients.find(clientId); iter != m_clients.end())
      return iter->second;

    pruneIdleLocked();

    debug_log("Creating rate limit buckets for client '{}' ({} others tracked)", clientId, m_clients.size());

    auto buckets = std::make_shared<ClientBuckets>(ClientBuckets {
      .hourly = std::make_unique<TokenBucket>(m_policy.perClientHourlyLimit, std::chrono::hours(1), m_clock),
      .burst  = std::make_unique<TokenBucket>(m_policy.burstLimit, m_policy.burstWindow, m_clock),
    });

    m_clients.emplace(clientId, buckets);

    return buckets;
  }

  fn LayeredRateLimiter::admit(const String& clientId) -> Result<Unit, RateLimitRejection> {
    using enum RateLimitLayer;

    if (!m_global.tryConsume()) {
      warn_log("Global daily rate limit reached");
      return Err<RateLimitRejection>({ .layer = Global, .retryAfter = m_global.timeUntilReset(), .message = "Rate limited: global daily limit reached" });
    }

    const SharedPointer<ClientBuckets> buckets = bucketsFor(clientId);

    if (!buckets->hourly->tryConsume()) {
      warn_log("Hourly rate limit reached for client '{}'", clientId);
      return Err<RateLimitRejection>({ .layer = PerClient, .retryAfter = buckets->hourly->timeUntilReset(), .message = "Rate limited: hourly limit reached for this client" });
    }

    if (!buckets->burst->tryConsume()) {
      warn_log("Burst protection triggered for client '{}'", clientId);
      return Err<RateLimitRejection>({ .layer = Burst, .retryAfter = buckets->burst->timeUntilReset(), .message = "Burst protection triggered: too many requests in a short time" });
    }

    return {};
  }

  fn LayeredRateLimiter::remainingFor(const String& clientId) -> u32 {
    const SharedPointer<ClientBuckets> buckets = bucketsFor(clientId);

    return std::min({ m_global.remaining(), buckets->hourly->remaining(), buckets->burst->remaining() });
  }

  fn LayeredRateLimiter::trackedClients() -> usize {
    const LockGuard lock(m_clientsMutex);
    return m_clients.size();
  }

  fn ToError(const RateLimitRejection& rejection) -> NimbusError {
    return { utils::error::NimbusErrorCode::RateLimited, std::format("{} (retry in {}s)", rejection.message, std::chrono::ceil<std::chrono::seconds>(rejection.retryAfter).count()) };
  }
} // namespace nimbus::services::ratelimit
