#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/autonomous/activity_logger.hpp"
#include "internal/autonomous/autonomous_scheduler.hpp"
#include "internal/autonomous/content_generator.hpp"
#include "internal/db/data_store.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_connection.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/events/event_log_middleware.hpp"
#include "internal/generation/grpc_generation_client.hpp"
#include "internal/generation/template_generation_client.hpp"
#include "internal/health/proc_health_probe.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/quality/quality_gate.hpp"
#if MUSE_DB_POSTGRES
#include "internal/db/postgres/pg_connection.hpp"
#endif

namespace muse::factory {

using namespace muse;
namespace cfg = muse::runtime::config;

namespace {

template <typename T>
T Or(T value, T fallback) {
  return value == T{} ? fallback : value;
}

std::shared_ptr<generation::GenerationClient> BuildGenerationClient(const cfg::GenerationConfig& config) {
  if (config.has_grpc() && !config.grpc().endpoint().empty()) {
    generation::GrpcGenerationOptions options;
    options.endpoint = config.grpc().endpoint();
    options.timeout  = std::chrono::milliseconds(Or<uint32_t>(config.grpc().timeout_ms(), 60000));
    options.model    = config.grpc().model();
    MUSE_LOG_INFO("generation over gRPC", {observability::StringField("endpoint", options.endpoint)});
    return std::make_shared<generation::GrpcGenerationClient>(std::move(options));
  }

  const uint64_t seed = config.has_local() ? config.local().seed() : 0;
  MUSE_LOG_INFO("generation with the offline template client");
  return std::make_shared<generation::TemplateGenerationClient>(seed);
}

} // namespace

db::PoolOptions PoolOptionsFrom(const cfg::PoolConfig& config) {
  db::PoolOptions options;
  options.min_connections = Or<uint32_t>(config.min_connections(), 1);
  options.max_connections = Or<uint32_t>(config.max_connections(), 8);
  options.idle_timeout    = std::chrono::milliseconds(Or<uint32_t>(config.idle_timeout_ms(), 30000));
  options.acquire_timeout = std::chrono::milliseconds(Or<uint32_t>(config.acquire_timeout_ms(), 5000));
  if (options.min_connections > options.max_connections) {
    throw std::runtime_error("Invalid configuration: pool.min_connections exceeds pool.max_connections");
  }
  return options;
}

util::RetryOptions RetryOptionsFrom(const cfg::RetryConfig& config) {
  util::RetryOptions options;
  options.max_attempts       = Or<uint32_t>(config.max_attempts(), 3);
  options.initial_delay      = std::chrono::milliseconds(Or<uint32_t>(config.initial_delay_ms(), 1000));
  options.max_delay          = std::chrono::milliseconds(Or<uint32_t>(config.max_delay_ms(), 10000));
  options.backoff_multiplier = Or<double>(config.backoff_multiplier(), 2.0);
  return options;
}

batch::BatchOptions BatchOptionsFrom(const cfg::RuntimeConfig& config) {
  batch::BatchOptions options;
  options.batch_size     = Or<uint32_t>(config.batch().batch_size(), 100);
  options.flush_interval = std::chrono::milliseconds(Or<uint32_t>(config.batch().flush_interval_ms(), 5000));
  options.max_retries    = Or<uint32_t>(config.batch().max_retries(), 3);
  options.concurrency    = Or<uint32_t>(config.batch().concurrency(), 1);
  options.chunk_retry    = RetryOptionsFrom(config.retry());
  return options;
}

util::CircuitBreaker::Options BreakerOptionsFrom(const cfg::CircuitBreakerConfig& config, const char* name) {
  util::CircuitBreaker::Options options;
  options.name              = name;
  options.failure_threshold = Or<uint32_t>(config.failure_threshold(), 5);
  options.reset_timeout     = std::chrono::milliseconds(Or<uint32_t>(config.reset_timeout_ms(), 60000));
  return options;
}

db::ConnectionFactory ConnectionFactoryFrom(const cfg::DatabaseConfig& config) {
  if (config.has_postgres()) {
#if MUSE_DB_POSTGRES
    const auto uri = config.postgres().connection_uri();
    return [uri]() -> std::unique_ptr<db::Connection> { return std::make_unique<db::postgres::PgConnection>(uri); };
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  db::sqlite::SqliteOptions options;
  if (config.has_sqlite()) {
    options.path         = config.sqlite().path();
    options.wal_mode     = config.sqlite().wal_mode();
    options.busy_timeout = std::chrono::milliseconds(Or<uint32_t>(config.sqlite().busy_timeout_ms(), 5000));
  }
  if (options.path.empty()) options.path = "muse.db";

  return [options]() -> std::unique_ptr<db::Connection> { return std::make_unique<db::sqlite::SqliteConnection>(options); };
}

/*
    Build full application dependency graph
*/
std::unique_ptr<service::ServiceContext> Build(const cfg::RuntimeConfig& config) {
  auto ctx = std::make_unique<service::ServiceContext>();

  if (config.observability().metrics_enabled()) {
    ctx->metrics = std::make_unique<observability::Metrics>();
  }

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  ctx->pool = std::make_shared<db::ConnectionPool>(ConnectionFactoryFrom(config.database()), PoolOptionsFrom(config.pool()));
  {
    auto conn = ctx->pool->Acquire();
    db::sql::BootstrapSchema(*conn);
  }

  events::EventBusOptions bus_options;
  bus_options.max_handlers_per_type = Or<uint32_t>(config.events().max_handlers_per_type(), 64);
  ctx->bus = std::make_shared<events::EventBus>(bus_options);
  ctx->bus->Use(events::MakeEventLogMiddleware(ctx->pool));
  ctx->bus->OnError([](const events::DomainEvent& event, const std::string& error) {
    MUSE_LOG_WARN("event handler failed",
                  {observability::StringField("event_type", event.event_type), observability::StringField("event_id", event.event_id),
                   observability::StringField("error", error)});
  });

  ctx->store = std::make_shared<db::DataStore>(ctx->pool, ctx->bus, BatchOptionsFrom(config), ctx->metrics.get());

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  ctx->generation = BuildGenerationClient(config.generation());

  quality::QualityGateOptions gate_options;
  gate_options.retry   = RetryOptionsFrom(config.retry());
  gate_options.breaker = BreakerOptionsFrom(config.circuit_breaker(), "quality-assessment");
  ctx->quality_gate    = std::make_shared<quality::QualityGate>(ctx->generation, gate_options);

  autonomous::ContentGeneratorOptions generator_options;
  generator_options.retry   = RetryOptionsFrom(config.retry());
  generator_options.breaker = BreakerOptionsFrom(config.circuit_breaker(), "content-generation");
  generator_options.seed    = config.generation().has_local() ? config.generation().local().seed() : 0;
  ctx->content_generator    = std::make_shared<autonomous::ContentGenerator>(ctx->generation, generator_options);

  for (auto* breaker : {&ctx->quality_gate->Breaker(), &ctx->content_generator->Breaker()}) {
    breaker->OnStateChange([name = breaker->Name()](util::BreakerState from, util::BreakerState to) {
      MUSE_LOG_WARN("circuit breaker state change", {observability::StringField("breaker", name), observability::StringField("from", util::ToString(from)),
                                                     observability::StringField("to", util::ToString(to))});
    });
  }

  const auto&              health = config.health();
  health::HealthThresholds thresholds;
  thresholds.max_cpu_usage       = Or<double>(health.max_cpu_usage(), 70.0);
  thresholds.max_memory_usage_mb = Or<uint64_t>(health.max_memory_usage_mb(), 2048);
  thresholds.min_disk_space_mb   = Or<uint64_t>(health.min_disk_space_mb(), 1024);
  ctx->health = std::make_shared<health::ProcHealthProbe>(thresholds, std::chrono::milliseconds(Or<uint32_t>(health.sample_interval_ms(), 10000)),
                                                          health.disk_path().empty() ? std::string(".") : health.disk_path());
  ctx->health->Start();

  // ------------------------------------------------------------------
  // Scheduler
  // ------------------------------------------------------------------
  ctx->activity = std::make_shared<autonomous::ActivityLogger>(ctx->store);

  autonomous::SchedulerOptions scheduler_options;
  scheduler_options.seed_config        = config.autonomous();
  scheduler_options.log_retention_days = Or<uint32_t>(config.log_retention_days(), 30);
  scheduler_options.min_disk_space_mb  = thresholds.min_disk_space_mb;

  ctx->scheduler = std::make_shared<autonomous::AutonomousScheduler>(ctx->store, ctx->content_generator, ctx->quality_gate, ctx->health,
                                                                     ctx->activity, scheduler_options, ctx->metrics.get());
  ctx->scheduler->Initialize();

  return ctx;
}

void Shutdown(service::ServiceContext& ctx) {
  if (ctx.scheduler) ctx.scheduler->Shutdown();
  if (ctx.health) ctx.health->Stop();
  if (ctx.store) ctx.store->Close();
  if (ctx.pool) ctx.pool->Close();
}

} // namespace muse::factory
