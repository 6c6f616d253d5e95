/**
 * @file Types.hpp
 * @brief Short names for the standard types used throughout Nimbus++.
 *
 * Every header and source pulls its aliases from here so that signatures read
 * the same across the library, the CLI and the tests.
 */

#pragma once

#include <array>         // std::array (Array)
#include <cstdint>       // std::{u,}int{8,32,64}_t
#include <functional>    // std::function (Fn)
#include <map>           // std::map (Map)
#include <memory>        // std::{shared_ptr, unique_ptr}
#include <mutex>         // std::{mutex, lock_guard}
#include <optional>      // std::optional (Option)
#include <span>          // std::span (Span)
#include <string>        // std::string (String)
#include <string_view>   // std::string_view (StringView)
#include <unordered_map> // std::unordered_map (UnorderedMap)
#include <vector>        // std::vector (Vec)

#include "Definitions.hpp"

namespace nimbus::utils::types {
  /// @name Fixed-width numbers
  /// @{
  using u8    = std::uint8_t;
  using u32   = std::uint32_t;
  using u64   = std::uint64_t;
  using i32   = std::int32_t;
  using i64   = std::int64_t;
  using f64   = double;
  using usize = std::size_t;
  /// @}

  /**
   * @brief Return type of functions that produce nothing.
   *
   * `Result<>` defaults its value type to Unit.
   */
  using Unit = void;

  using String     = std::string;
  using StringView = std::string_view;
  using PCStr      = const char*; ///< Null-terminated C string, e.g. argv entries.
  using RawPointer = void*;       ///< Only seen at C callback boundaries (libcurl).

  using Exception = std::exception;

  using Mutex     = std::mutex;
  using LockGuard = std::lock_guard<Mutex>;

  /**
   * @brief An absent value. Compare or return it where an Option is expected.
   */
  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename Tp>
  using Option = std::optional<Tp>;

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  /**
   * @brief Non-owning view over contiguous elements, such as a batch of coordinates.
   */
  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  /// Ordered, so help output lists arguments predictably.
  template <typename Key, typename Val>
  using Map = std::map<Key, Val>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  template <typename Tp>
  using SharedPointer = std::shared_ptr<Tp>;

  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  /**
   * @brief Type-erased callable, used for cache loaders.
   */
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace nimbus::utils::types
