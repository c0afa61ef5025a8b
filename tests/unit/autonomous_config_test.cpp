#include "internal/autonomous/autonomous_config.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = muse::autonomous::v1;
using muse::autonomous::ApplyPatch;
using muse::autonomous::DefaultAutonomousConfig;
using muse::autonomous::Overlay;
using muse::autonomous::ValidateConfig;

bool Invalid(const v1::AutonomousConfig& config) {
  try {
    ValidateConfig(config);
  } catch (const muse::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto config = DefaultAutonomousConfig();
  assert(!config.enabled());
  assert(config.interval_minutes() == 30);
  assert(config.quality_threshold() == 65);
  assert(config.max_concurrent_operations() == 1);
  assert(config.max_daily_operations() == 48);
  assert(config.time_slots_size() == 2);
  assert(config.time_slots(0).enabled());
  assert(!config.time_slots(1).enabled());
  assert(config.resource_limits().max_tokens_per_operation() == 4000);
  assert(config.content_types_size() == 4);
  assert(!Invalid(config));
}

void TestOverlayKeepsBaseWhereUnset() {
  v1::AutonomousConfig seed;
  seed.set_enabled(true);
  seed.set_max_daily_operations(5);
  seed.mutable_resource_limits()->set_max_cpu_usage(50.0);

  const auto merged = Overlay(DefaultAutonomousConfig(), seed);
  assert(merged.enabled());
  assert(merged.max_daily_operations() == 5);
  assert(merged.interval_minutes() == 30);
  assert(merged.resource_limits().max_cpu_usage() == 50.0);
  assert(merged.resource_limits().max_memory_usage_mb() == 2048);
  assert(merged.time_slots_size() == 2);
}

void TestPatchReplacesOnlyPresentFields() {
  v1::AutonomousConfigPatch patch;
  patch.set_quality_threshold(80);
  patch.set_enabled(true);
  patch.mutable_content_types()->add_types(v1::CONTENT_TYPE_PLOT);

  const auto patched = ApplyPatch(DefaultAutonomousConfig(), patch);
  assert(patched.quality_threshold() == 80);
  assert(patched.enabled());
  assert(patched.interval_minutes() == 30);
  assert(patched.content_types_size() == 1);
  assert(patched.time_slots_size() == 2);

  // explicit zero/false are applied, unlike the overlay
  v1::AutonomousConfigPatch disable;
  disable.set_enabled(false);
  disable.set_max_daily_operations(0);
  const auto disabled = ApplyPatch(patched, disable);
  assert(!disabled.enabled());
  assert(disabled.max_daily_operations() == 0);
}

void TestPatchCanClearTimeSlots() {
  v1::AutonomousConfigPatch patch;
  patch.mutable_time_slots();
  const auto patched = ApplyPatch(DefaultAutonomousConfig(), patch);
  assert(patched.time_slots_size() == 0);
}

void TestValidationRejectsOutOfRange() {
  auto config = DefaultAutonomousConfig();
  config.set_interval_minutes(0);
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.set_quality_threshold(101);
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.set_max_concurrent_operations(0);
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.mutable_time_slots(0)->set_end("18:75");
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.add_content_types(v1::CONTENT_TYPE_UNSPECIFIED);
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.mutable_resource_limits()->set_max_cpu_usage(120.0);
  assert(Invalid(config));

  config = DefaultAutonomousConfig();
  config.set_max_daily_operations(0);
  assert(!Invalid(config));
}

} // namespace

int main() {
  TestDefaults();
  TestOverlayKeepsBaseWhereUnset();
  TestPatchReplacesOnlyPresentFields();
  TestPatchCanClearTimeSlots();
  TestValidationRejectsOutOfRange();

  std::cout << "muse_unit_autonomous_config: pass\n";
  return 0;
}
