#include "internal/util/circuit_breaker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

using muse::util::BreakerState;
using muse::util::CircuitBreaker;
using muse::util::CircuitOpen;

struct ManualClock {
  muse::util::TimePoint now = muse::util::FromUnixMillis(1'700'000'000'000);

  muse::util::ClockFn Fn() {
    return [this] { return now; };
  }
};

CircuitBreaker::Options MakeOptions(ManualClock& clock, uint32_t threshold) {
  CircuitBreaker::Options options;
  options.name              = "test";
  options.failure_threshold = threshold;
  options.reset_timeout     = std::chrono::milliseconds(1000);
  options.clock             = clock.Fn();
  return options;
}

void Fail(CircuitBreaker& breaker) {
  try {
    breaker.Execute([]() -> void { throw std::runtime_error("down"); });
  } catch (const CircuitOpen&) {
    throw;
  } catch (const std::runtime_error&) {
  }
}

void TestOpensAfterThresholdAndStopsCalling() {
  ManualClock    clock;
  CircuitBreaker breaker(MakeOptions(clock, 3));

  Fail(breaker);
  Fail(breaker);
  assert(breaker.State() == BreakerState::kClosed);
  Fail(breaker);
  assert(breaker.State() == BreakerState::kOpen);

  int  invoked = 0;
  bool open    = false;
  try {
    breaker.Execute([&] { ++invoked; });
  } catch (const CircuitOpen&) {
    open = true;
  }
  assert(open);
  assert(invoked == 0);
}

void TestSuccessResetsFailureCount() {
  ManualClock    clock;
  CircuitBreaker breaker(MakeOptions(clock, 2));

  Fail(breaker);
  assert(breaker.FailureCount() == 1);
  assert(breaker.Execute([] { return 7; }) == 7);
  assert(breaker.FailureCount() == 0);
  Fail(breaker);
  assert(breaker.State() == BreakerState::kClosed);
}

void TestHalfOpenTrialClosesOnSuccess() {
  ManualClock    clock;
  CircuitBreaker breaker(MakeOptions(clock, 1));

  std::vector<std::pair<BreakerState, BreakerState>> transitions;
  breaker.OnStateChange([&](BreakerState from, BreakerState to) { transitions.emplace_back(from, to); });

  Fail(breaker);
  assert(breaker.State() == BreakerState::kOpen);

  clock.now += std::chrono::milliseconds(999);
  bool still_open = false;
  try {
    breaker.Execute([] {});
  } catch (const CircuitOpen&) {
    still_open = true;
  }
  assert(still_open);

  clock.now += std::chrono::milliseconds(1);
  breaker.Execute([] {});
  assert(breaker.State() == BreakerState::kClosed);

  assert(transitions.size() == 3);
  assert(transitions[0].second == BreakerState::kOpen);
  assert(transitions[1].second == BreakerState::kHalfOpen);
  assert(transitions[2].second == BreakerState::kClosed);
}

void TestHalfOpenTrialFailureReopens() {
  ManualClock    clock;
  CircuitBreaker breaker(MakeOptions(clock, 1));

  Fail(breaker);
  clock.now += std::chrono::milliseconds(1500);
  Fail(breaker);
  assert(breaker.State() == BreakerState::kOpen);

  // the timeout window restarts from the failed trial
  clock.now += std::chrono::milliseconds(500);
  bool open = false;
  try {
    breaker.Execute([] {});
  } catch (const CircuitOpen&) {
    open = true;
  }
  assert(open);
}

void TestResetForcesClosed() {
  ManualClock    clock;
  CircuitBreaker breaker(MakeOptions(clock, 1));
  Fail(breaker);
  breaker.Reset();
  assert(breaker.State() == BreakerState::kClosed);
  assert(breaker.FailureCount() == 0);
  assert(muse::util::ToString(BreakerState::kHalfOpen) == "half-open");
}

} // namespace

int main() {
  TestOpensAfterThresholdAndStopsCalling();
  TestSuccessResetsFailureCount();
  TestHalfOpenTrialClosesOnSuccess();
  TestHalfOpenTrialFailureReopens();
  TestResetForcesClosed();

  std::cout << "muse_unit_circuit_breaker: pass\n";
  return 0;
}
