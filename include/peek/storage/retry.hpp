#pragma once

#include <peek/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

namespace peek::storage {

/// Bounded exponential backoff: attempt i (0-based) waits base_delay * 2^i
/// before attempt i+1. max_attempts counts the first try.
struct RetryPolicy {
  std::size_t max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  /// Replaceable for tests; defaults to std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleep;
  /// Called before each retry with (attempt_number, error). Optional.
  std::function<void(std::size_t, const peek::core::Error&)> on_retry;
};

/// Outcome of one attempt: the value, or an error tagged transient/permanent.
struct AttemptError {
  peek::core::Error error;
  bool transient{false};
};

/// Calls op() until it succeeds, fails permanently, or attempts run out.
/// op must return std::expected<T, AttemptError>.
template <typename Op>
auto with_retry(const RetryPolicy& policy, Op&& op)
    -> std::expected<typename std::invoke_result_t<Op&>::value_type, peek::core::Error> {
  const std::size_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  for (std::size_t attempt = 0;; ++attempt) {
    auto result = op();
    if (result) {
      if constexpr (std::is_void_v<typename decltype(result)::value_type>) {
        return {};
      } else {
        return std::move(*result);
      }
    }
    if (!result.error().transient || attempt + 1 >= attempts) {
      return std::unexpected(std::move(result.error().error));
    }
    if (policy.on_retry) policy.on_retry(attempt + 1, result.error().error);
    const auto delay = policy.base_delay * (1LL << attempt);
    if (policy.sleep) {
      policy.sleep(delay);
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
}

}  // namespace peek::storage
