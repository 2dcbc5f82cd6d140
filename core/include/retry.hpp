/**
 * @file retry.hpp
 * @brief Bounded polling with a fixed interval
 * @details
 * Used wherever ember waits on something outside its control: the control
 * socket of a freshly spawned hypervisor, the SSH daemon of a booting guest,
 * the liveness of a session.
 *
 * ```cpp
 * ember::retry_t policy{.attempts = 3, .interval = 500ms};
 * bool found = ember::retry_until(policy, [&](size_t) {
 *   return std::filesystem::exists(socket_path);
 * });
 * ```
 *
 * The predicate may throw to abort the loop early; the exception propagates
 * unchanged.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>

namespace ember {

using steady_clock_t = std::chrono::steady_clock;

struct retry_t {
  size_t attempts = 3;

  std::chrono::milliseconds interval = std::chrono::milliseconds(500);

  /**
   * @brief Optional absolute deadline. No attempt starts after it passes.
   */
  std::optional<steady_clock_t::time_point> deadline = std::nullopt;
};

/**
 * @brief Call `pred(attempt)` until it returns true or the policy runs out
 * @return true if the predicate was satisfied, false if attempts or the
 * deadline were exhausted
 */
template <typename pred_t>
bool retry_until(const retry_t &policy, pred_t &&pred) {
  for (size_t attempt = 0; attempt < policy.attempts; attempt++) {
    if (policy.deadline.has_value() &&
        steady_clock_t::now() > *policy.deadline)
      return false;
    if (pred(attempt))
      return true;
    if (attempt + 1 < policy.attempts) {
      auto wake = steady_clock_t::now() + policy.interval;
      if (policy.deadline.has_value() && wake > *policy.deadline)
        return false;
      std::this_thread::sleep_until(wake);
    }
  }
  return false;
}

} // namespace ember
