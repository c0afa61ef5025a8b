#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <thread>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace muse::util {

struct RetryOptions {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{10000};
  double                    backoff_multiplier = 2.0;

  // attempt is 1-based. Empty means every std::exception is retried.
  std::function<bool(const std::exception&, uint32_t attempt)> should_retry;

  // Called before sleeping ahead of the next attempt.
  std::function<void(const std::exception&, uint32_t attempt, std::chrono::milliseconds next_delay)> on_retry;

  // Empty means std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleep;
};

inline std::chrono::milliseconds BackoffDelay(const RetryOptions& options, uint32_t attempt) {
  const double base   = static_cast<double>(options.initial_delay.count());
  const double scaled = base * std::pow(options.backoff_multiplier, static_cast<double>(attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(options.max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

/*
  Runs fn until it returns, the attempt budget is spent or should_retry
  declines. The exception of the last attempt propagates unchanged.
*/
template <typename Fn>
auto Retry(Fn&& fn, const RetryOptions& options) -> std::invoke_result_t<Fn&> {
  const uint32_t max_attempts = std::max<uint32_t>(options.max_attempts, 1);

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const std::exception& e) {
      if (attempt >= max_attempts) throw;
      if (options.should_retry && !options.should_retry(e, attempt)) throw;

      const auto delay = BackoffDelay(options, attempt);
      if (options.on_retry) options.on_retry(e, attempt, delay);

      if (options.sleep) {
        options.sleep(delay);
      } else {
        std::this_thread::sleep_for(delay);
      }
    }
  }
}

// ------------------------------------------------------------------
// Predicates
// ------------------------------------------------------------------

inline bool IsTransientStoreError(const std::exception& e) {
  return dynamic_cast<const TransientStoreError*>(&e) != nullptr || dynamic_cast<const PoolExhausted*>(&e) != nullptr;
}

inline bool IsRetryableGenerationError(const std::exception& e) {
  if (const auto* generation = dynamic_cast<const GenerationError*>(&e)) {
    return generation->Retryable();
  }
  return false;
}

} // namespace muse::util
