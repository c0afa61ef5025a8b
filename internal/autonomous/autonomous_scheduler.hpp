#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "internal/autonomous/activity_logger.hpp"
#include "internal/autonomous/content_generator.hpp"
#include "internal/autonomous/pending_writes.hpp"
#include "internal/db/model/activity_log_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/health/health_probe.hpp"
#include "internal/quality/quality_gate.hpp"
#include "internal/util/time.hpp"

namespace muse::db {
class DataStore;
}

namespace muse::observability {
class Metrics;
}

namespace muse::autonomous {

struct SchedulerOptions {
  util::ClockFn clock = util::Now;

  // Seeds the config table when it is empty.
  muse::autonomous::v1::AutonomousConfig seed_config;

  uint32_t log_retention_days = 30;

  // Resource limits come from the configuration; the disk floor does not.
  uint64_t min_disk_space_mb = 1024;

  // 0 seeds from std::random_device.
  uint64_t random_seed = 0;
};

enum class CycleOutcome {
  kExecuted,
  kNotRunning,
  kOutsideTimeSlot,
  kUnhealthy,
  kDailyLimitReached,
  kBusy,
  kNothingToRun,
};

std::string_view ToString(CycleOutcome outcome);

struct SchedulerStatus {
  bool                                    enabled = false;
  bool                                    running = false;
  std::optional<db::model::OperationRecord> current_operation;
  std::size_t                             queue_length = 0;
  std::optional<int64_t>                  last_operation_time_ms;
  uint32_t                                today_count      = 0;
  uint64_t                                total_operations = 0;
  double                                  success_rate     = 0.0;
  muse::autonomous::v1::SystemHealth      system_health;
};

/*
  AutonomousScheduler

  stopped -> running on Start() when the configuration is enabled,
  running -> stopped on Stop(). While running a timer thread calls
  RunCycle() every interval_minutes.

  A cycle, in order:
    1. skip outside every enabled time slot
    2. skip while the health probe reports unhealthy
    3. skip once today's quota is used (UTC day)
    4. skip while an operation is in flight
    5. take the oldest queued request, else synthesize one of a
       configured content type chosen uniformly
    6. generate, assess, save if the gate says so, record the operation

  At most one operation is running at any instant. A RunCycle() call that
  finds another cycle in progress returns kBusy without waiting. Failures
  inside step 6 end as a failed operation and never leave the loop.

  Stop() clears the queue and marks the in-flight operation cancelled. The
  executing cycle notices at its next checkpoint and leaves the cancelled
  record alone.
*/
class AutonomousScheduler {
 public:
  AutonomousScheduler(std::shared_ptr<db::DataStore>          store,
                      std::shared_ptr<ContentGenerator>       generator,
                      std::shared_ptr<quality::QualityGate>   gate,
                      std::shared_ptr<health::HealthProbe>    health,
                      std::shared_ptr<ActivityLogger>         activity,
                      SchedulerOptions                        options,
                      observability::Metrics*                 metrics = nullptr);
  ~AutonomousScheduler();

  AutonomousScheduler(const AutonomousScheduler&)            = delete;
  AutonomousScheduler& operator=(const AutonomousScheduler&) = delete;

  // Loads the latest configuration, seeding the table when it is empty.
  void Initialize();

  // Stop(), purge old activity logs, flush writers.
  void Shutdown();

  // False when already running or disabled.
  bool Start();
  void Stop();

  CycleOutcome RunCycle();

  SchedulerStatus GetStatus() const;

  muse::autonomous::v1::AutonomousConfig GetConfiguration() const;

  // Validates, stores a new version in one transaction, then swaps the
  // in-memory copy. Throws ValidationError.
  muse::autonomous::v1::AutonomousConfig UpdateConfiguration(const muse::autonomous::v1::AutonomousConfigPatch& patch);

  // Returns the operation id. Queued requests run before synthesized ones.
  std::string QueueOperation(model::ContentType type, const std::optional<std::string>& project_id = std::nullopt);

  std::vector<db::model::ActivityLogRecord> GetLogs(const db::model::LogFilter& filter);
  db::model::LogSummary                     GetLogSummary(uint32_t days);

 private:
  void TimerLoop();

  std::optional<db::model::OperationRecord> NextOperationLocked(const muse::autonomous::v1::AutonomousConfig& config, util::TimePoint now);
  void                                      Execute(db::model::OperationRecord operation, const muse::autonomous::v1::AutonomousConfig& config);

  // Throws Cancelled once the operation is no longer the current one.
  void Checkpoint(const std::string& operation_id) const;

  // True when a new day started and the counter was reset.
  bool ResetDailyCountIfNeededLocked(util::TimePoint now);
  void ApplyThresholdsLocked();
  void Persist(db::model::OperationRecord record);
  void RecordMetrics(const db::model::OperationRecord& record);

  std::shared_ptr<db::DataStore>        store_;
  std::shared_ptr<ContentGenerator>     generator_;
  std::shared_ptr<quality::QualityGate> gate_;
  std::shared_ptr<health::HealthProbe>  health_;
  std::shared_ptr<ActivityLogger>       activity_;
  SchedulerOptions                      options_;
  observability::Metrics*               metrics_;

  // Serializes cycles between the timer thread and direct callers.
  std::mutex cycle_mutex_;

  mutable std::mutex                        mutex_;
  std::condition_variable                   timer_cv_;
  muse::autonomous::v1::AutonomousConfig    config_;
  bool                                      running_ = false;
  std::deque<db::model::OperationRecord>    queue_;
  std::optional<db::model::OperationRecord> current_;
  int64_t                                   day_number_     = 0;
  uint32_t                                  daily_count_    = 0;
  uint64_t                                  total_          = 0;
  uint64_t                                  successful_     = 0;
  std::optional<int64_t>                    last_operation_ms_;
  std::mt19937_64                           rng_;

  PendingWrites pending_;
  std::thread   timer_;
};

} // namespace muse::autonomous
