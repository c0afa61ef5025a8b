#include "proc_health_probe.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace muse::health {

ProcHealthProbe::ProcHealthProbe(HealthThresholds thresholds, std::chrono::milliseconds sample_interval, std::filesystem::path disk_path)
    : sample_interval_(sample_interval), disk_path_(std::move(disk_path)), thresholds_(thresholds) {
  last_cpu_ = ReadCpuTimes();
  // Until the first sample, report healthy with zero usage.
  last_.set_healthy(true);
}

ProcHealthProbe::~ProcHealthProbe() {
  Stop();
}

void ProcHealthProbe::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&ProcHealthProbe::Loop, this);
}

void ProcHealthProbe::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

muse::autonomous::v1::SystemHealth ProcHealthProbe::LastHealth() const {
  std::lock_guard lock(mutex_);
  return last_;
}

muse::autonomous::v1::SystemHealth ProcHealthProbe::Sample() {
  const auto cpu    = ReadCpuTimes();
  const auto rss    = ReadResidentMb();
  const auto disk   = ReadDiskAvailableMb();
  const auto now_ms = util::ToUnixMillis(util::Now());

  std::lock_guard lock(mutex_);

  double usage = last_.cpu_usage();
  if (cpu.total > last_cpu_.total) {
    usage = 100.0 * static_cast<double>(cpu.busy - last_cpu_.busy) / static_cast<double>(cpu.total - last_cpu_.total);
  }
  last_cpu_ = cpu;

  muse::autonomous::v1::SystemHealth health;
  health.set_cpu_usage(usage);
  health.set_memory_usage_mb(rss);
  health.set_disk_space_mb(disk);
  health.set_sampled_at_ms(now_ms);
  ApplyThresholds(health, thresholds_);

  last_ = health;
  return health;
}

void ProcHealthProbe::SetThresholds(const HealthThresholds& thresholds) {
  std::lock_guard lock(mutex_);
  thresholds_ = thresholds;
  ApplyThresholds(last_, thresholds_);
}

void ProcHealthProbe::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    const auto health = Sample();
    if (!health.healthy()) {
      MUSE_LOG_DEBUG("system health below thresholds", {observability::DoubleField("cpu_usage", health.cpu_usage()),
                                                        observability::DoubleField("memory_usage_mb", health.memory_usage_mb()),
                                                        observability::DoubleField("disk_space_mb", health.disk_space_mb())});
    }
    lock.lock();
    cv_.wait_for(lock, sample_interval_, [this] { return !running_; });
  }
}

// First line: cpu user nice system idle iowait irq softirq steal ...
ProcHealthProbe::CpuTimes ProcHealthProbe::ReadCpuTimes() const {
  std::ifstream in("/proc/stat");
  std::string   label;
  if (!(in >> label) || label != "cpu") return {};

  CpuTimes times;
  uint64_t value = 0;
  for (int field = 0; field < 8 && in >> value; ++field) {
    times.total += value;
    // idle and iowait
    if (field != 3 && field != 4) times.busy += value;
  }
  return times;
}

double ProcHealthProbe::ReadResidentMb() const {
  std::ifstream in("/proc/self/status");
  std::string   line;
  while (std::getline(in, line)) {
    if (line.rfind("VmRSS:", 0) != 0) continue;
    std::istringstream fields(line.substr(6));
    uint64_t           kb = 0;
    fields >> kb;
    return static_cast<double>(kb) / 1024.0;
  }
  return 0.0;
}

double ProcHealthProbe::ReadDiskAvailableMb() const {
  std::error_code ec;
  const auto      info = std::filesystem::space(disk_path_, ec);
  if (ec) {
    MUSE_LOG_WARN("disk space probe failed", {observability::StringField("path", disk_path_.string()), observability::StringField("error", ec.message())});
    return 0.0;
  }
  return static_cast<double>(info.available) / (1024.0 * 1024.0);
}

} // namespace muse::health
