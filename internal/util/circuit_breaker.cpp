#include "circuit_breaker.hpp"

#include <utility>

namespace muse::util {

std::string_view ToString(BreakerState state) {
  switch (state) {
    case BreakerState::kClosed:
      return "closed";
    case BreakerState::kOpen:
      return "open";
    case BreakerState::kHalfOpen:
      return "half-open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(Options options) : options_(std::move(options)) {
  if (options_.failure_threshold == 0) options_.failure_threshold = 1;
}

void CircuitBreaker::OnStateChange(StateListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

BreakerState CircuitBreaker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint32_t CircuitBreaker::FailureCount() const {
  std::lock_guard lock(mutex_);
  return failure_count_;
}

void CircuitBreaker::Reset() {
  std::unique_lock lock(mutex_);
  failure_count_   = 0;
  trial_in_flight_ = false;
  Transition(BreakerState::kClosed, lock);
}

TimePoint CircuitBreaker::NowLocked() const {
  return options_.clock ? options_.clock() : Now();
}

void CircuitBreaker::Admit() {
  std::unique_lock lock(mutex_);

  switch (state_) {
    case BreakerState::kClosed:
      return;

    case BreakerState::kOpen:
      if (NowLocked() - last_failure_ >= options_.reset_timeout) {
        trial_in_flight_ = true;
        Transition(BreakerState::kHalfOpen, lock);
        return;
      }
      throw CircuitOpen("circuit '" + options_.name + "' is open");

    case BreakerState::kHalfOpen:
      if (trial_in_flight_) {
        throw CircuitOpen("circuit '" + options_.name + "' is half-open with a trial in flight");
      }
      trial_in_flight_ = true;
      return;
  }
}

void CircuitBreaker::OnSuccess() {
  std::unique_lock lock(mutex_);
  failure_count_ = 0;
  if (state_ == BreakerState::kHalfOpen) {
    trial_in_flight_ = false;
    Transition(BreakerState::kClosed, lock);
  }
}

void CircuitBreaker::OnFailure() {
  std::unique_lock lock(mutex_);
  ++failure_count_;
  last_failure_ = NowLocked();

  if (state_ == BreakerState::kHalfOpen) {
    trial_in_flight_ = false;
    Transition(BreakerState::kOpen, lock);
    return;
  }

  if (state_ == BreakerState::kClosed && failure_count_ >= options_.failure_threshold) {
    Transition(BreakerState::kOpen, lock);
  }
}

// Listener runs without the lock held; it may call State().
void CircuitBreaker::Transition(BreakerState to, std::unique_lock<std::mutex>& lock) {
  const auto from = state_;
  if (from == to) return;

  state_        = to;
  auto listener = listener_;
  lock.unlock();
  if (listener) listener(from, to);
  lock.lock();
}

} // namespace muse::util
