#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <thread>

#include "internal/health/health_probe.hpp"

namespace muse::health {

/*
  Linux probe.

    cpu_usage        busy share of /proc/stat between two samples, percent
    memory_usage_mb  resident set of this process (/proc/self/status VmRSS)
    disk_space_mb    space available on disk_path

  A sampling thread refreshes LastHealth() every sample_interval.
*/
class ProcHealthProbe final : public HealthProbe {
 public:
  ProcHealthProbe(HealthThresholds thresholds, std::chrono::milliseconds sample_interval, std::filesystem::path disk_path);
  ~ProcHealthProbe() override;

  ProcHealthProbe(const ProcHealthProbe&)            = delete;
  ProcHealthProbe& operator=(const ProcHealthProbe&) = delete;

  void Start();
  void Stop();

  muse::autonomous::v1::SystemHealth LastHealth() const override;
  muse::autonomous::v1::SystemHealth Sample() override;

  void SetThresholds(const HealthThresholds& thresholds) override;

 private:
  struct CpuTimes {
    uint64_t busy  = 0;
    uint64_t total = 0;
  };

  void     Loop();
  CpuTimes ReadCpuTimes() const;
  double   ReadResidentMb() const;
  double   ReadDiskAvailableMb() const;

  std::chrono::milliseconds sample_interval_;
  std::filesystem::path     disk_path_;

  mutable std::mutex                 mutex_;
  HealthThresholds                   thresholds_;
  muse::autonomous::v1::SystemHealth last_;
  CpuTimes                           last_cpu_;

  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace muse::health
