#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/batch/batch_write_coordinator.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/circuit_breaker.hpp"
#include "internal/util/retry.hpp"

namespace muse::factory {

/*
  Build

  Composition root. Opens the pool and bootstraps the schema, wires the
  event log, writers, collaborators and scheduler, then loads the stored
  configuration. The returned context owns every long-lived component.

  This is the only place that knows concrete driver and client types.
*/
std::unique_ptr<service::ServiceContext> Build(const muse::runtime::config::RuntimeConfig& config);

// Reverse of Build: scheduler, health sampling, writers, pool.
void Shutdown(service::ServiceContext& ctx);

// Config sections with zero values replaced by defaults.
db::PoolOptions               PoolOptionsFrom(const muse::runtime::config::PoolConfig& config);
batch::BatchOptions           BatchOptionsFrom(const muse::runtime::config::RuntimeConfig& config);
util::RetryOptions            RetryOptionsFrom(const muse::runtime::config::RetryConfig& config);
util::CircuitBreaker::Options BreakerOptionsFrom(const muse::runtime::config::CircuitBreakerConfig& config, const char* name);

db::ConnectionFactory ConnectionFactoryFrom(const muse::runtime::config::DatabaseConfig& config);

} // namespace muse::factory
