#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace muse::util {

enum class BreakerState { kClosed, kOpen, kHalfOpen };

std::string_view ToString(BreakerState state);

/*
  CircuitBreaker

  Guards one call site of one dependency.

    closed    -> open       after failure_threshold consecutive failures
    open      -> half-open  once reset_timeout has elapsed since the last failure
    half-open -> closed     when the single trial call succeeds
    half-open -> open       when it fails (timeout window restarts)

  While open, or while a half-open trial is in flight, Execute throws
  CircuitOpen without invoking the guarded function.
*/
class CircuitBreaker {
 public:
  struct Options {
    std::string               name{"default"};
    uint32_t                  failure_threshold = 5;
    std::chrono::milliseconds reset_timeout{60000};
    ClockFn                   clock;
  };

  using StateListener = std::function<void(BreakerState from, BreakerState to)>;

  explicit CircuitBreaker(Options options);

  template <typename Fn>
  auto Execute(Fn&& fn) -> std::invoke_result_t<Fn&> {
    Admit();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
        fn();
        OnSuccess();
      } else {
        auto result = fn();
        OnSuccess();
        return result;
      }
    } catch (...) {
      OnFailure();
      throw;
    }
  }

  void OnStateChange(StateListener listener);

  BreakerState State() const;
  uint32_t     FailureCount() const;
  const std::string& Name() const {
    return options_.name;
  }

  // Force back to closed with a zero counter.
  void Reset();

 private:
  void      Admit();
  void      OnSuccess();
  void      OnFailure();
  void      Transition(BreakerState to, std::unique_lock<std::mutex>& lock);
  TimePoint NowLocked() const;

  Options options_;

  mutable std::mutex mutex_;
  BreakerState       state_         = BreakerState::kClosed;
  uint32_t           failure_count_ = 0;
  TimePoint          last_failure_{};
  bool               trial_in_flight_ = false;
  StateListener      listener_;
};

} // namespace muse::util
