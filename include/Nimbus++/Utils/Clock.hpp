#pragma once

#include <chrono> // std::chrono::{system_clock, milliseconds}

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils::clock {
  namespace {
    using types::LockGuard;
    using types::Mutex;
    using types::SharedPointer;
    using types::Unit;
  } // namespace

  using TimePoint = std::chrono::system_clock::time_point;

  /**
   * @brief Source of the current time for expiry, refill and date arithmetic.
   *
   * Components that reason about elapsed time take a clock instead of reading
   * the system clock directly, so tests can drive time by hand.
   */
  class IClock {
   public:
    IClock(const IClock&) = delete;
    IClock(IClock&&)      = delete;

    fn operator=(const IClock&)->IClock& = delete;
    fn operator=(IClock&&)->IClock&      = delete;

    virtual ~IClock() = default;

    [[nodiscard]] virtual fn now() const -> TimePoint = 0;

   protected:
    IClock() = default;
  };

  class SystemClock final : public IClock {
   public:
    SystemClock() = default;

    [[nodiscard]] fn now() const -> TimePoint override {
      return std::chrono::system_clock::now();
    }
  };

  /**
   * @brief Clock that only moves when told to.
   */
  class ManualClock final : public IClock {
   public:
    explicit ManualClock(const TimePoint start = TimePoint {})
      : m_now(start) {}

    [[nodiscard]] fn now() const -> TimePoint override {
      const LockGuard lock(m_mutex);
      return m_now;
    }

    fn advance(const std::chrono::milliseconds delta) -> Unit {
      const LockGuard lock(m_mutex);
      m_now += delta;
    }

    fn set(const TimePoint instant) -> Unit {
      const LockGuard lock(m_mutex);
      m_now = instant;
    }

   private:
    mutable Mutex m_mutex;
    TimePoint     m_now;
  };

  /**
   * @brief Returns the process-wide system clock.
   */
  inline fn GetSystemClock() -> SharedPointer<const IClock> {
    static const SharedPointer<const IClock> Instance = std::make_shared<SystemClock>();
    return Instance;
  }
} // namespace nimbus::utils::clock
