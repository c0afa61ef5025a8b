#pragma once

#include <memory>

namespace muse::db {
class ConnectionPool;
class DataStore;
} // namespace muse::db
namespace muse::events {
class EventBus;
}
namespace muse::generation {
class GenerationClient;
}
namespace muse::quality {
class QualityGate;
}
namespace muse::health {
class ProcHealthProbe;
}
namespace muse::autonomous {
class ActivityLogger;
class AutonomousScheduler;
class ContentGenerator;
} // namespace muse::autonomous
namespace muse::observability {
class Metrics;
}

namespace muse::service {

/*
  Everything the daemon owns, built once by the factory.

  No component reaches for a process-wide instance; each one is handed
  what it needs from here.
*/
struct ServiceContext {
  std::unique_ptr<observability::Metrics> metrics;

  std::shared_ptr<db::ConnectionPool> pool;
  std::shared_ptr<events::EventBus>   bus;
  std::shared_ptr<db::DataStore>      store;

  std::shared_ptr<generation::GenerationClient> generation;
  std::shared_ptr<quality::QualityGate>         quality_gate;
  std::shared_ptr<autonomous::ContentGenerator> content_generator;
  std::shared_ptr<health::ProcHealthProbe>      health;

  std::shared_ptr<autonomous::ActivityLogger>      activity;
  std::shared_ptr<autonomous::AutonomousScheduler> scheduler;
};

} // namespace muse::service
