#include "autonomous_config.hpp"

#include <string>

#include "internal/autonomous/time_slots.hpp"
#include "internal/model/content_type.hpp"
#include "internal/util/errors.hpp"

namespace muse::autonomous {

namespace v1 = muse::autonomous::v1;

v1::AutonomousConfig DefaultAutonomousConfig() {
  v1::AutonomousConfig config;
  config.set_enabled(false);
  config.set_interval_minutes(30);
  config.set_quality_threshold(65);
  config.set_max_concurrent_operations(1);
  config.set_max_daily_operations(48);

  auto* day = config.add_time_slots();
  day->set_start("09:00");
  day->set_end("18:00");
  day->set_enabled(true);

  auto* night = config.add_time_slots();
  night->set_start("22:00");
  night->set_end("06:00");
  night->set_enabled(false);

  auto* limits = config.mutable_resource_limits();
  limits->set_max_cpu_usage(70.0);
  limits->set_max_memory_usage_mb(2048);
  limits->set_max_api_calls_per_hour(100);
  limits->set_max_tokens_per_operation(4000);

  for (auto type : model::kAllContentTypes) config.add_content_types(type);
  return config;
}

v1::AutonomousConfig Overlay(v1::AutonomousConfig base, const v1::AutonomousConfig& overlay) {
  if (overlay.enabled()) base.set_enabled(true);
  if (overlay.interval_minutes() != 0) base.set_interval_minutes(overlay.interval_minutes());
  if (overlay.quality_threshold() != 0) base.set_quality_threshold(overlay.quality_threshold());
  if (overlay.max_concurrent_operations() != 0) base.set_max_concurrent_operations(overlay.max_concurrent_operations());
  if (overlay.max_daily_operations() != 0) base.set_max_daily_operations(overlay.max_daily_operations());
  if (overlay.time_slots_size() > 0) *base.mutable_time_slots() = overlay.time_slots();
  if (overlay.content_types_size() > 0) *base.mutable_content_types() = overlay.content_types();

  if (overlay.has_resource_limits()) {
    const auto& from   = overlay.resource_limits();
    auto*       limits = base.mutable_resource_limits();
    if (from.max_cpu_usage() != 0.0) limits->set_max_cpu_usage(from.max_cpu_usage());
    if (from.max_memory_usage_mb() != 0) limits->set_max_memory_usage_mb(from.max_memory_usage_mb());
    if (from.max_api_calls_per_hour() != 0) limits->set_max_api_calls_per_hour(from.max_api_calls_per_hour());
    if (from.max_tokens_per_operation() != 0) limits->set_max_tokens_per_operation(from.max_tokens_per_operation());
  }
  return base;
}

v1::AutonomousConfig ApplyPatch(v1::AutonomousConfig base, const v1::AutonomousConfigPatch& patch) {
  if (patch.has_enabled()) base.set_enabled(patch.enabled());
  if (patch.has_interval_minutes()) base.set_interval_minutes(patch.interval_minutes());
  if (patch.has_quality_threshold()) base.set_quality_threshold(patch.quality_threshold());
  if (patch.has_max_concurrent_operations()) base.set_max_concurrent_operations(patch.max_concurrent_operations());
  if (patch.has_max_daily_operations()) base.set_max_daily_operations(patch.max_daily_operations());
  if (patch.has_time_slots()) *base.mutable_time_slots() = patch.time_slots().slots();
  if (patch.has_content_types()) *base.mutable_content_types() = patch.content_types().types();
  if (patch.has_resource_limits()) *base.mutable_resource_limits() = patch.resource_limits();
  return base;
}

void ValidateConfig(const v1::AutonomousConfig& config) {
  if (config.interval_minutes() == 0) throw util::ValidationError("interval_minutes must be at least 1");
  if (config.quality_threshold() > 100) throw util::ValidationError("quality_threshold must be within 0-100");
  if (config.max_concurrent_operations() == 0) throw util::ValidationError("max_concurrent_operations must be at least 1");
  ValidateTimeSlots(config.time_slots());

  for (int i = 0; i < config.content_types_size(); ++i) {
    if (!model::IsKnown(config.content_types(i))) {
      throw util::ValidationError("content_types[" + std::to_string(i) + "] is not a known content type");
    }
  }

  const auto& limits = config.resource_limits();
  if (limits.max_cpu_usage() < 0.0 || limits.max_cpu_usage() > 100.0) {
    throw util::ValidationError("resource_limits.max_cpu_usage must be within 0-100");
  }
}

} // namespace muse::autonomous
