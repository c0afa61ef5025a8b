#include "health_probe.hpp"

namespace muse::health {

bool ApplyThresholds(muse::autonomous::v1::SystemHealth& health, const HealthThresholds& thresholds) {
  const bool cpu_ok    = health.cpu_usage() <= thresholds.max_cpu_usage;
  const bool memory_ok = health.memory_usage_mb() <= static_cast<double>(thresholds.max_memory_usage_mb);
  const bool disk_ok   = health.disk_space_mb() >= static_cast<double>(thresholds.min_disk_space_mb);
  health.set_healthy(cpu_ok && memory_ok && disk_ok);
  return health.healthy();
}

} // namespace muse::health
