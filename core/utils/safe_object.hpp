/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>

// clang-format off
/**
 * Protected object wrapper. Allow read-write access.
 * @tparam T object type
 * Example:
 * @code
 *  SafeObject<std::string> obj("1");
 *  bool const is_one_att1 =
 *      obj.sharedAccess([](auto const &str) {
 *          return str == "1";
 *      });
 *  obj.exclusiveAccess([](auto &str) {
 *      str = "2";
 *  });
 *  std::optional<bool> const is_two =
 *      obj.trySharedAccessFor(std::chrono::milliseconds(10),
 *          [](auto const &str) {
 *              return str == "2";
 *          });
 * @endcode
 */
// clang-format on
template <typename T, typename M = std::shared_timed_mutex>
struct SafeObject {
  using Type = T;

  template <typename... Args>
  SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

  template <typename F>
  inline auto exclusiveAccess(F &&f) {
    std::unique_lock lock(cs_);
    return std::forward<F>(f)(t_);
  }

  template <typename F>
  inline auto sharedAccess(F &&f) const {
    std::shared_lock lock(cs_);
    return std::forward<F>(f)(t_);
  }

  /**
   * Like exclusiveAccess, but gives up after `timeout`.
   * @return std::nullopt if the lock was not acquired in time, otherwise
   * result of `f` (or true for void `f`)
   */
  template <typename F, typename Rep, typename Period>
  inline auto tryExclusiveAccessFor(
      const std::chrono::duration<Rep, Period> &timeout, F &&f) {
    std::unique_lock lock(cs_, std::defer_lock);
    return tryAccess(lock, timeout, std::forward<F>(f), t_);
  }

  template <typename F, typename Rep, typename Period>
  inline auto trySharedAccessFor(
      const std::chrono::duration<Rep, Period> &timeout, F &&f) const {
    std::shared_lock lock(cs_, std::defer_lock);
    return tryAccess(lock, timeout, std::forward<F>(f), t_);
  }

  T &unsafeGet() {
    return t_;
  }

  const T &unsafeGet() const {
    return t_;
  }

 private:
  template <typename L, typename Duration, typename F, typename U>
  static auto tryAccess(L &lock, const Duration &timeout, F &&f, U &t) {
    using R = std::invoke_result_t<F, U &>;
    if constexpr (std::is_void_v<R>) {
      if (not lock.try_lock_for(timeout)) {
        return std::optional<bool>{};
      }
      std::forward<F>(f)(t);
      return std::optional<bool>{true};
    } else {
      if (not lock.try_lock_for(timeout)) {
        return std::optional<R>{};
      }
      return std::optional<R>{std::forward<F>(f)(t)};
    }
  }

  T t_;
  mutable M cs_;
};
