#pragma once

#include <chrono> // std::chrono::{milliseconds, minutes}
#include <format> // std::format
#include <list>   // std::list

#include "Clock.hpp"
#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace nimbus::utils::cache {
  namespace {
    using types::f64;
    using types::Fn;
    using types::LockGuard;
    using types::Mutex;
    using types::None;
    using types::Option;
    using types::Result;
    using types::SharedPointer;
    using types::String;
    using types::StringView;
    using types::u64;
    using types::Unit;
    using types::UnorderedMap;
    using types::usize;

    using clock::IClock;
    using clock::TimePoint;

    using std::chrono::milliseconds;
  } // namespace

  /**
   * @struct CachePolicy
   * @brief Expiry and size bound of one cache instance.
   */
  struct CachePolicy {
    milliseconds ttl        = std::chrono::minutes(15); ///< Entries older than this are treated as absent.
    usize        maxEntries = 1000;                     ///< Least-recently-used entries are evicted beyond this. 0 disables the bound.
  };

  struct CacheStats {
    String name;
    u64    hits      = 0;
    u64    misses    = 0;
    u64    evictions = 0;
    usize  size      = 0;
    usize  maxEntries = 0;

    [[nodiscard]] fn hitRate() const -> f64 {
      const u64 total = hits + misses;
      return total == 0 ? 0.0 : static_cast<f64>(hits) / static_cast<f64>(total);
    }
  };

  /**
   * @brief In-memory TTL cache for a single kind of data.
   *
   * Keys are prefixed with the cache's namespace, so two instances can share a
   * key space without colliding. Expiry is lazy: an entry is dropped the first
   * time it is looked up after its TTL has passed.
   *
   * @tparam T The cached value type.
   */
  template <typename T>
  class Cache {
   public:
    Cache(String name, const CachePolicy policy, SharedPointer<const IClock> clock = clock::GetSystemClock())
      : m_name(std::move(name)), m_policy(policy), m_clock(std::move(clock)) {}

    Cache(const Cache&)                = delete;
    fn operator=(const Cache&)->Cache& = delete;

    /**
     * @brief Looks up a value.
     * @param key The un-namespaced key.
     * @return The value if present and not expired, otherwise None.
     */
    fn get(const String& key) -> Option<T> {
      const LockGuard lock(m_mutex);

      const String fullKey = namespaced(key);

      auto iter = m_entries.find(fullKey);

      if (iter == m_entries.end()) {
        ++m_misses;
        return None;
      }

      if (isExpired(iter->second, m_clock->now())) {
        m_lru.erase(iter->second.lruPosition);
        m_entries.erase(iter);
        ++m_misses;
        return None;
      }

      m_lru.splice(m_lru.begin(), m_lru, iter->second.lruPosition);
      ++m_hits;

      return iter->second.value;
    }

    /**
     * @brief Inserts or overwrites a value, stamping it with the current time.
     */
    fn put(const String& key, T value) -> Unit {
      const LockGuard lock(m_mutex);

      const String    fullKey = namespaced(key);
      const TimePoint now     = m_clock->now();

      if (auto iter = m_entries.find(fullKey); iter != m_entries.end()) {
        iter->second.value      = std::move(value);
        iter->second.insertedAt = now;
        m_lru.splice(m_lru.begin(), m_lru, iter->second.lruPosition);
        return;
      }

      m_lru.push_front(fullKey);
      m_entries.emplace(fullKey, Entry { .value = std::move(value), .insertedAt = now, .lruPosition = m_lru.begin() });

      evictOverflow(now);
    }

    /**
     * @brief Returns the cached value, or runs @p loader on a miss.
     *
     * The loader runs without the cache lock held. Only a successful result is
     * stored; an error is handed back to the caller and the next call retries.
     *
     * @param key The un-namespaced key.
     * @param loader Produces the value on a miss.
     * @return The cached or freshly loaded value, or the loader's error.
     */
    fn getOrLoad(const String& key, const Fn<Result<T>()>& loader) -> Result<T> {
      if (Option<T> cached = get(key)) {
        debug_log("Cache hit: {}:{}", m_name, key);
        return *std::move(cached);
      }

      debug_log("Cache miss: {}:{}", m_name, key);

      Result<T> loaded = loader();

      if (loaded)
        put(key, *loaded);

      return loaded;
    }

    /**
     * @brief Removes one entry.
     * @return true if an entry was removed.
     */
    fn invalidate(const String& key) -> bool {
      const LockGuard lock(m_mutex);

      auto iter = m_entries.find(namespaced(key));

      if (iter == m_entries.end())
        return false;

      m_lru.erase(iter->second.lruPosition);
      m_entries.erase(iter);

      return true;
    }

    fn invalidateAll() -> Unit {
      const LockGuard lock(m_mutex);
      m_entries.clear();
      m_lru.clear();
    }

    /**
     * @brief Number of live (unexpired) entries.
     */
    [[nodiscard]] fn size() const -> usize {
      const LockGuard lock(m_mutex);
      return liveCount(m_clock->now());
    }

    [[nodiscard]] fn stats() const -> CacheStats {
      const LockGuard lock(m_mutex);

      return {
        .name       = m_name,
        .hits       = m_hits,
        .misses     = m_misses,
        .evictions  = m_evictions,
        .size       = liveCount(m_clock->now()),
        .maxEntries = m_policy.maxEntries,
      };
    }

    [[nodiscard]] fn name() const -> const String& {
      return m_name;
    }

    [[nodiscard]] fn policy() const -> const CachePolicy& {
      return m_policy;
    }

   private:
    struct Entry {
      T                            value;
      TimePoint                    insertedAt;
      std::list<String>::iterator lruPosition;
    };

    String                      m_name;
    CachePolicy                 m_policy;
    SharedPointer<const IClock> m_clock;

    mutable Mutex               m_mutex;
    std::list<String>           m_lru; ///< Most recently used at the front.
    UnorderedMap<String, Entry> m_entries;

    u64 m_hits      = 0;
    u64 m_misses    = 0;
    u64 m_evictions = 0;

    [[nodiscard]] fn namespaced(const StringView key) const -> String {
      return std::format("{}:{}", m_name, key);
    }

    [[nodiscard]] fn isExpired(const Entry& entry, const TimePoint now) const -> bool {
      return now - entry.insertedAt > m_policy.ttl;
    }

    [[nodiscard]] fn liveCount(const TimePoint now) const -> usize {
      usize count = 0;

      for (const auto& [key, entry] : m_entries)
        if (!isExpired(entry, now))
          ++count;

      return count;
    }

    // Expired entries go first so a stale entry never costs a live one its slot.
    fn evictOverflow(const TimePoint now) -> Unit {
      if (m_policy.maxEntries == 0 || m_entries.size() <= m_policy.maxEntries)
        return;

      for (auto iter = m_entries.begin(); iter != m_entries.end() && m_entries.size() > m_policy.maxEntries;) {
        if (isExpired(iter->second, now)) {
          m_lru.erase(iter->second.lruPosition);
          iter = m_entries.erase(iter);
          ++m_evictions;
        } else
          ++iter;
      }

      while (m_entries.size() > m_policy.maxEntries && !m_lru.empty()) {
        m_entries.erase(m_lru.back());
        m_lru.pop_back();
        ++m_evictions;
      }
    }
  };
} // namespace nimbus::utils::cache
