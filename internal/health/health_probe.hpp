#pragma once

#include <cstdint>

#include "muse/autonomous/v1.hpp"

namespace muse::health {

struct HealthThresholds {
  double   max_cpu_usage       = 70.0;
  uint64_t max_memory_usage_mb = 2048;
  uint64_t min_disk_space_mb   = 1024;
};

// Sets healthy on the snapshot from the thresholds and returns it.
bool ApplyThresholds(muse::autonomous::v1::SystemHealth& health, const HealthThresholds& thresholds);

/*
  Resource health source polled by the scheduler.

  LastHealth() is the latest background sample and never blocks on I/O.
  Sample() takes a fresh snapshot (used for per-operation deltas).
*/
class HealthProbe {
 public:
  virtual ~HealthProbe() = default;

  virtual muse::autonomous::v1::SystemHealth LastHealth() const = 0;
  virtual muse::autonomous::v1::SystemHealth Sample()           = 0;

  virtual void SetThresholds(const HealthThresholds& thresholds) = 0;
};

} // namespace muse::health
