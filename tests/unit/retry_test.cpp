#include "internal/util/retry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using muse::util::Retry;
using muse::util::RetryOptions;

RetryOptions NoSleep(uint32_t attempts) {
  RetryOptions options;
  options.max_attempts = attempts;
  options.sleep        = [](std::chrono::milliseconds) {};
  return options;
}

void TestAlwaysFailingRunsMaxAttemptsAndRethrowsLast() {
  int  calls   = 0;
  auto options = NoSleep(4);

  std::string caught;
  try {
    Retry(
        [&]() -> int {
          ++calls;
          throw std::runtime_error("attempt " + std::to_string(calls));
        },
        options);
  } catch (const std::runtime_error& e) {
    caught = e.what();
  }

  assert(calls == 4);
  assert(caught == "attempt 4");
}

void TestSucceedsAfterTransientFailures() {
  int  calls  = 0;
  auto result = Retry(
      [&] {
        if (++calls < 3) throw muse::util::TransientStoreError("busy");
        return 42;
      },
      NoSleep(5));

  assert(result == 42);
  assert(calls == 3);
}

void TestBackoffDoublesAndCaps() {
  RetryOptions options;
  options.initial_delay      = std::chrono::milliseconds(100);
  options.max_delay          = std::chrono::milliseconds(350);
  options.backoff_multiplier = 2.0;

  assert(muse::util::BackoffDelay(options, 1).count() == 100);
  assert(muse::util::BackoffDelay(options, 2).count() == 200);
  assert(muse::util::BackoffDelay(options, 3).count() == 350);
  assert(muse::util::BackoffDelay(options, 9).count() == 350);
}

void TestOnRetrySeesEachDelayBeforeSleeping() {
  auto options          = NoSleep(3);
  options.initial_delay = std::chrono::milliseconds(10);

  std::vector<int64_t> delays;
  std::vector<int64_t> slept;
  options.on_retry = [&](const std::exception&, uint32_t, std::chrono::milliseconds delay) { delays.push_back(delay.count()); };
  options.sleep    = [&](std::chrono::milliseconds delay) { slept.push_back(delay.count()); };

  bool threw = false;
  try {
    Retry([]() -> void { throw std::runtime_error("down"); }, options);
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
  assert((delays == std::vector<int64_t>{10, 20}));
  assert(slept == delays);
}

void TestPredicateStopsPermanentErrors() {
  int  calls           = 0;
  auto options         = NoSleep(5);
  options.should_retry = [](const std::exception& e, uint32_t) { return muse::util::IsTransientStoreError(e); };

  bool threw = false;
  try {
    Retry(
        [&]() -> void {
          ++calls;
          throw muse::util::ValidationError("bad row");
        },
        options);
  } catch (const muse::util::ValidationError&) {
    threw = true;
  }

  assert(threw);
  assert(calls == 1);
}

void TestGenerationErrorRetryability() {
  assert(muse::util::IsRetryableGenerationError(muse::util::GenerationError("rate limited", true)));
  assert(!muse::util::IsRetryableGenerationError(muse::util::GenerationError("bad request", false)));
  assert(!muse::util::IsRetryableGenerationError(std::runtime_error("other")));
  assert(muse::util::IsTransientStoreError(muse::util::PoolExhausted("timeout")));
}

} // namespace

int main() {
  TestAlwaysFailingRunsMaxAttemptsAndRethrowsLast();
  TestSucceedsAfterTransientFailures();
  TestBackoffDoublesAndCaps();
  TestOnRetrySeesEachDelayBeforeSleeping();
  TestPredicateStopsPermanentErrors();
  TestGenerationErrorRetryability();

  std::cout << "muse_unit_retry: pass\n";
  return 0;
}
