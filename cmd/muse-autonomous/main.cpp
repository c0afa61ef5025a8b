#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/autonomous/autonomous_scheduler.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: muse-autonomous <config.yaml> OR muse-autonomous --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = muse::config::ConfigLoader::LoadFromYaml(config_path);

    muse::observability::InitializeLogging(config);
    if (config.observability().tracing_enabled()) muse::observability::InitializeTracing(config);
    if (config.observability().metrics_enabled()) muse::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto ctx = muse::factory::Build(config);

    // Register signal handlers before starting the loop to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const bool started = ctx->scheduler->Start();
    MUSE_LOG_INFO("muse-autonomous ready", {muse::observability::BoolField("scheduler_running", started)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MUSE_LOG_INFO("Shutting down muse-autonomous");

    muse::factory::Shutdown(*ctx);
    ctx.reset();

    muse::observability::ShutdownMetrics();
    muse::observability::ShutdownTracing();
    muse::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MUSE_LOG_ERROR("Fatal error", {muse::observability::StringField("error", e.what())});
    muse::observability::ShutdownMetrics();
    muse::observability::ShutdownTracing();
    muse::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
