#include "autonomous_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <utility>

#include "internal/autonomous/autonomous_config.hpp"
#include "internal/autonomous/time_slots.hpp"
#include "internal/db/data_store.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/model/operation_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace muse::autonomous {

namespace v1 = muse::autonomous::v1;

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

std::string TypeName(model::ContentType type) {
  return std::string(model::ToString(type));
}

std::string RecommendationName(v1::Recommendation recommendation) {
  switch (recommendation) {
    case v1::RECOMMENDATION_SAVE:
      return "save";
    case v1::RECOMMENDATION_DISCARD:
      return "discard";
    case v1::RECOMMENDATION_REVIEW:
      return "review";
    default:
      return "unspecified";
  }
}

} // namespace

std::string_view ToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kExecuted:
      return "executed";
    case CycleOutcome::kNotRunning:
      return "not_running";
    case CycleOutcome::kOutsideTimeSlot:
      return "outside_time_slot";
    case CycleOutcome::kUnhealthy:
      return "unhealthy";
    case CycleOutcome::kDailyLimitReached:
      return "daily_limit_reached";
    case CycleOutcome::kBusy:
      return "busy";
    case CycleOutcome::kNothingToRun:
      return "nothing_to_run";
  }
  return "unknown";
}

AutonomousScheduler::AutonomousScheduler(std::shared_ptr<db::DataStore>        store,
                                         std::shared_ptr<ContentGenerator>     generator,
                                         std::shared_ptr<quality::QualityGate> gate,
                                         std::shared_ptr<health::HealthProbe>  health,
                                         std::shared_ptr<ActivityLogger>       activity,
                                         SchedulerOptions                      options,
                                         observability::Metrics*               metrics)
    : store_(std::move(store)),
      generator_(std::move(generator)),
      gate_(std::move(gate)),
      health_(std::move(health)),
      activity_(std::move(activity)),
      options_(std::move(options)),
      metrics_(metrics),
      config_(Overlay(DefaultAutonomousConfig(), options_.seed_config)),
      rng_(options_.random_seed == 0 ? std::random_device{}() : options_.random_seed) {
  if (!options_.clock) options_.clock = util::Now;
  day_number_ = util::UtcDayNumber(options_.clock());
}

AutonomousScheduler::~AutonomousScheduler() {
  Stop();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void AutonomousScheduler::Initialize() {
  const auto now = options_.clock();

  v1::AutonomousConfig config;
  if (auto latest = store_->LatestConfig()) {
    config = latest->config;
  } else {
    config = Overlay(DefaultAutonomousConfig(), options_.seed_config);
    ValidateConfig(config);

    auto uow = store_->BeginUnitOfWork();
    uow->Configs().Insert(config, util::ToUnixMillis(now));
    google::protobuf::Struct payload;
    util::SetString(&payload, "source", "seed");
    store_->Publish(events::MakeEvent(events::event_types::kConfigUpdated, "autonomous", events::aggregate_types::kConfig, std::move(payload)),
                    &uow->Conn());
    uow->Commit();
  }

  const auto day       = util::UtcDayNumber(now);
  const auto done_today = store_->CountOperationsSince(day * kDayMs);

  {
    std::lock_guard lock(mutex_);
    config_      = std::move(config);
    day_number_  = day;
    daily_count_ = static_cast<uint32_t>(std::max<int64_t>(done_today, 0));
    ApplyThresholdsLocked();
  }

  activity_->Info(model::LogCategory::kSystem, "Autonomous scheduler initialized", std::nullopt,
                  {{"operations_today", std::to_string(done_today)}});
}

void AutonomousScheduler::Shutdown() {
  Stop();

  const auto cutoff  = util::ToUnixMillis(options_.clock()) - static_cast<int64_t>(options_.log_retention_days) * kDayMs;
  const auto removed = store_->PurgeLogsOlderThan(cutoff);
  MUSE_LOG_INFO("activity logs purged",
                {observability::IntField("removed", removed), observability::IntField("retention_days", options_.log_retention_days)});

  activity_->Flush();
  pending_.Drain();
}

bool AutonomousScheduler::Start() {
  uint32_t interval = 0;
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      activity_->Warn(model::LogCategory::kSystem, "Autonomous mode already running");
      return false;
    }
    if (!config_.enabled()) {
      activity_->Info(model::LogCategory::kSystem, "Autonomous mode is disabled");
      return false;
    }
    running_ = true;
    interval = config_.interval_minutes();
  }

  if (timer_.joinable()) timer_.join();
  timer_ = std::thread(&AutonomousScheduler::TimerLoop, this);

  activity_->Info(model::LogCategory::kSystem, "Autonomous mode started with " + std::to_string(interval) + " minute intervals");
  return true;
}

void AutonomousScheduler::Stop() {
  std::optional<db::model::OperationRecord> cancelled;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
    queue_.clear();
    if (current_ && current_->status == v1::OPERATION_STATUS_RUNNING) {
      current_->status      = v1::OPERATION_STATUS_CANCELLED;
      current_->end_time_ms = util::ToUnixMillis(options_.clock());
      cancelled             = *current_;
    }
    current_.reset();
  }
  if (metrics_) metrics_->SetQueueDepth("operations", 0);

  // Record the cancellation before waiting on an in-flight cycle.
  if (cancelled) {
    Persist(*cancelled);
    RecordMetrics(*cancelled);
  }

  timer_cv_.notify_all();
  if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) timer_.join();

  activity_->Info(model::LogCategory::kSystem, "Autonomous mode stopped");
}

void AutonomousScheduler::TimerLoop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    const auto interval = std::chrono::minutes(std::max<uint32_t>(1, config_.interval_minutes()));
    timer_cv_.wait_for(lock, interval, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      const auto outcome = RunCycle();
      MUSE_LOG_DEBUG("scheduler cycle", {observability::StringField("outcome", ToString(outcome))});
    } catch (const std::exception& e) {
      activity_->Error(model::LogCategory::kSystem, "Error in operation cycle", std::nullopt, {{"error", e.what()}});
    }
    lock.lock();
  }
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

CycleOutcome AutonomousScheduler::RunCycle() {
  // A second caller never queues behind an in-flight cycle.
  std::unique_lock cycle(cycle_mutex_, std::try_to_lock);
  if (!cycle.owns_lock()) {
    std::lock_guard lock(mutex_);
    if (!running_) return CycleOutcome::kNotRunning;
    MUSE_LOG_DEBUG("cycle already in progress; skipped");
    return CycleOutcome::kBusy;
  }

  const auto           now = options_.clock();
  v1::AutonomousConfig config;
  bool                 day_rolled = false;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return CycleOutcome::kNotRunning;
    day_rolled = ResetDailyCountIfNeededLocked(now);
    config     = config_;
  }
  if (day_rolled) activity_->Info(model::LogCategory::kSystem, "Daily operation counter reset");

  if (!WithinTimeSlots(config.time_slots(), util::LocalMinuteOfDay(now))) {
    MUSE_LOG_DEBUG("outside every enabled time slot; cycle skipped");
    return CycleOutcome::kOutsideTimeSlot;
  }

  const auto health = health_->LastHealth();
  if (!health.healthy()) {
    activity_->Warn(model::LogCategory::kResource, "System health check failed, skipping operation", std::nullopt,
                    {{"cpu_usage", std::to_string(health.cpu_usage())},
                     {"memory_usage_mb", std::to_string(health.memory_usage_mb())},
                     {"disk_space_mb", std::to_string(health.disk_space_mb())}});
    return CycleOutcome::kUnhealthy;
  }

  std::optional<db::model::OperationRecord> operation;
  CycleOutcome                              outcome = CycleOutcome::kExecuted;
  {
    std::lock_guard lock(mutex_);
    if (daily_count_ >= config.max_daily_operations()) {
      outcome = CycleOutcome::kDailyLimitReached;
    } else if (current_) {
      outcome = CycleOutcome::kBusy;
    } else {
      operation = NextOperationLocked(config, now);
      if (!operation) outcome = CycleOutcome::kNothingToRun;
    }
    if (metrics_) metrics_->SetQueueDepth("operations", queue_.size());
  }

  switch (outcome) {
    case CycleOutcome::kDailyLimitReached:
      activity_->Info(model::LogCategory::kSystem, "Daily operation limit reached", std::nullopt,
                      {{"limit", std::to_string(config.max_daily_operations())}});
      return outcome;
    case CycleOutcome::kBusy:
      MUSE_LOG_DEBUG("operation in flight; cycle skipped");
      return outcome;
    case CycleOutcome::kNothingToRun:
      activity_->Warn(model::LogCategory::kSystem, "No content types configured; nothing to run");
      return outcome;
    default:
      break;
  }

  Execute(std::move(*operation), config);
  return CycleOutcome::kExecuted;
}

std::optional<db::model::OperationRecord> AutonomousScheduler::NextOperationLocked(const v1::AutonomousConfig& config, util::TimePoint now) {
  if (!queue_.empty()) {
    auto next = std::move(queue_.front());
    queue_.pop_front();
    return next;
  }

  if (config.content_types_size() == 0) return std::nullopt;

  std::uniform_int_distribution<int> pick(0, config.content_types_size() - 1);

  db::model::OperationRecord operation;
  operation.id            = util::NewId();
  operation.type          = config.content_types(pick(rng_));
  operation.status        = v1::OPERATION_STATUS_PENDING;
  operation.start_time_ms = util::ToUnixMillis(now);
  return operation;
}

void AutonomousScheduler::Execute(db::model::OperationRecord operation, const v1::AutonomousConfig& config) {
  observability::SpanScope span("operation.execute");
  span.SetAttribute("operation_id", operation.id);
  span.SetAttribute("content_type", model::ToString(operation.type));

  const std::string id   = operation.id;
  const std::string type = TypeName(operation.type);

  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    operation.status        = v1::OPERATION_STATUS_RUNNING;
    operation.start_time_ms = util::ToUnixMillis(options_.clock());
    current_                = operation;
  }
  const auto started = std::chrono::steady_clock::now();
  bool       saved   = false;

  // Every exit from here runs the bookkeeping below, which clears current_.
  try {
    Persist(operation);
    activity_->Info(model::LogCategory::kOperation, "Starting " + type + " operation", id);

    const auto start_health = health_->Sample();
    Checkpoint(id);
    auto content = generator_->Generate(operation.type, config.resource_limits().max_tokens_per_operation(), [this, &id] { Checkpoint(id); });
    Checkpoint(id);

    const auto end_health = health_->Sample();
    operation.metrics.set_tokens_used(content.tokens_used());
    operation.metrics.set_api_calls(content.api_calls());
    operation.metrics.set_cpu_delta(std::max(0.0, end_health.cpu_usage() - start_health.cpu_usage()));
    operation.metrics.set_memory_delta_mb(std::max(0.0, end_health.memory_usage_mb() - start_health.memory_usage_mb()));

    const auto assessment = gate_->Assess(content, operation.type);
    Checkpoint(id);

    saved = quality::ShouldSave(assessment, config.quality_threshold());

    v1::OperationResult result;
    result.set_content_id(util::NewId());
    result.set_quality_score(assessment.overall_score());
    result.set_confidence(ContentGenerator::Confidence(operation.type));
    result.set_saved(saved);
    *result.mutable_content()    = content;
    *result.mutable_assessment() = assessment;

    const std::map<std::string, std::string> details = {
        {"quality_score", std::to_string(assessment.overall_score())},
        {"threshold", std::to_string(config.quality_threshold())},
        {"recommendation", RecommendationName(assessment.recommendation())},
    };

    if (saved) {
      db::model::ContentRecord record;
      record.id            = result.content_id();
      record.type          = operation.type;
      record.operation_id  = id;
      record.project_id    = operation.project_id;
      record.quality_score = assessment.overall_score();
      record.body          = content;
      record.created_at_ms = util::ToUnixMillis(options_.clock());
      pending_.Track(store_->SaveContent(std::move(record)), "content for operation " + id);
      activity_->Info(model::LogCategory::kQuality, "High quality " + type + " saved", id, details);
    } else {
      activity_->Info(model::LogCategory::kQuality, type + " discarded due to low quality", id, details);
    }

    operation.result = std::move(result);
    operation.status = v1::OPERATION_STATUS_COMPLETED;
  } catch (const util::Cancelled&) {
    operation.status = v1::OPERATION_STATUS_CANCELLED;
  } catch (const std::exception& e) {
    operation.status = v1::OPERATION_STATUS_FAILED;
    operation.error  = e.what();
    span.RecordException(e.what());
    activity_->Error(model::LogCategory::kOperation, std::string("Operation failed: ") + e.what(), id);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  operation.metrics.set_duration_ms(elapsed.count());
  operation.end_time_ms = util::ToUnixMillis(options_.clock());

  bool abandoned = false;
  {
    std::lock_guard lock(mutex_);
    abandoned = !current_ || current_->id != id;
    if (!abandoned) {
      current_.reset();
      if (operation.status != v1::OPERATION_STATUS_CANCELLED) {
        ++daily_count_;
        ++total_;
        if (saved && operation.status == v1::OPERATION_STATUS_COMPLETED) ++successful_;
        last_operation_ms_ = operation.end_time_ms;
      }
    }
  }

  // Stop() got here first and already recorded the cancellation.
  if (abandoned) {
    activity_->Info(model::LogCategory::kOperation, "Operation cancelled", id);
    return;
  }
  if (operation.status == v1::OPERATION_STATUS_CANCELLED) activity_->Info(model::LogCategory::kOperation, "Operation cancelled", id);

  Persist(operation);
  RecordMetrics(operation);
}

void AutonomousScheduler::Checkpoint(const std::string& operation_id) const {
  std::lock_guard lock(mutex_);
  if (!running_ || !current_ || current_->id != operation_id) {
    throw util::Cancelled("operation " + operation_id + " cancelled");
  }
}

bool AutonomousScheduler::ResetDailyCountIfNeededLocked(util::TimePoint now) {
  const auto day = util::UtcDayNumber(now);
  if (day == day_number_) return false;
  day_number_  = day;
  daily_count_ = 0;
  return true;
}

void AutonomousScheduler::ApplyThresholdsLocked() {
  health::HealthThresholds thresholds;
  thresholds.max_cpu_usage       = config_.resource_limits().max_cpu_usage();
  thresholds.max_memory_usage_mb = config_.resource_limits().max_memory_usage_mb();
  thresholds.min_disk_space_mb   = options_.min_disk_space_mb;
  health_->SetThresholds(thresholds);
}

void AutonomousScheduler::Persist(db::model::OperationRecord record) {
  const auto what = "operation " + record.id + " (" + std::string(model::ToString(record.status)) + ")";
  try {
    pending_.Track(store_->SaveOperation(std::move(record)), what);
  } catch (const util::InvalidState& e) {
    MUSE_LOG_ERROR("operation record dropped; writer closed", {observability::StringField("operation", what), observability::StringField("error", e.what())});
  }
}

void AutonomousScheduler::RecordMetrics(const db::model::OperationRecord& record) {
  if (!metrics_) return;
  metrics_->RecordOperation(model::ToString(record.type), model::ToString(record.status));
  metrics_->ObserveOperationDurationMs(model::ToString(record.type), static_cast<double>(record.metrics.duration_ms()));
}

// ------------------------------------------------------------------
// Queries and configuration
// ------------------------------------------------------------------

SchedulerStatus AutonomousScheduler::GetStatus() const {
  SchedulerStatus status;
  {
    std::lock_guard lock(mutex_);
    status.enabled                = config_.enabled();
    status.running                = running_;
    status.current_operation      = current_;
    status.queue_length           = queue_.size();
    status.last_operation_time_ms = last_operation_ms_;
    status.today_count            = daily_count_;
    status.total_operations       = total_;
    status.success_rate           = total_ > 0 ? static_cast<double>(successful_) / static_cast<double>(total_) * 100.0 : 0.0;
  }
  status.system_health = health_->LastHealth();
  return status;
}

v1::AutonomousConfig AutonomousScheduler::GetConfiguration() const {
  std::lock_guard lock(mutex_);
  return config_;
}

v1::AutonomousConfig AutonomousScheduler::UpdateConfiguration(const v1::AutonomousConfigPatch& patch) {
  v1::AutonomousConfig merged;
  {
    auto uow    = store_->BeginUnitOfWork();
    auto latest = uow->Configs().Latest();

    merged = ApplyPatch(latest ? latest->config : GetConfiguration(), patch);
    ValidateConfig(merged);

    uow->Configs().Insert(merged, util::ToUnixMillis(options_.clock()));

    google::protobuf::Struct payload;
    util::SetString(&payload, "source", "update");
    util::SetBool(&payload, "enabled", merged.enabled());
    util::SetNumber(&payload, "interval_minutes", merged.interval_minutes());
    util::SetNumber(&payload, "quality_threshold", merged.quality_threshold());
    store_->Publish(events::MakeEvent(events::event_types::kConfigUpdated, "autonomous", events::aggregate_types::kConfig, std::move(payload)),
                    &uow->Conn());
    uow->Commit();
  }

  {
    std::lock_guard lock(mutex_);
    config_ = merged;
    ApplyThresholdsLocked();
  }

  activity_->Info(model::LogCategory::kSystem, "Configuration updated");
  return merged;
}

std::string AutonomousScheduler::QueueOperation(model::ContentType type, const std::optional<std::string>& project_id) {
  if (!model::IsKnown(type)) throw util::ValidationError("unknown content type " + std::to_string(static_cast<int>(type)));

  db::model::OperationRecord operation;
  operation.id            = util::NewId();
  operation.type          = type;
  operation.status        = v1::OPERATION_STATUS_PENDING;
  operation.project_id    = project_id;
  operation.start_time_ms = util::ToUnixMillis(options_.clock());

  std::size_t depth = 0;
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(operation);
    depth = queue_.size();
  }
  if (metrics_) metrics_->SetQueueDepth("operations", depth);

  activity_->Info(model::LogCategory::kOperation, "Queued " + TypeName(type) + " operation", operation.id);
  return operation.id;
}

std::vector<db::model::ActivityLogRecord> AutonomousScheduler::GetLogs(const db::model::LogFilter& filter) {
  return activity_->Query(filter);
}

db::model::LogSummary AutonomousScheduler::GetLogSummary(uint32_t days) {
  return activity_->Summary(days);
}

} // namespace muse::autonomous
