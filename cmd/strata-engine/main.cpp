#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using strata::factory::Build;

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
    std::cerr << "Usage: strata-engine <config.yaml> OR strata-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = strata::config::ConfigLoader::LoadFromYaml(config_path);

    strata::observability::InitializeTracing(config);
    strata::observability::InitializeMetrics(config);
    strata::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto engine = Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine->Start();

    const auto health = engine->service->Health();
    STRATA_LOG_INFO("strata engine started",
                    {strata::observability::IntField("records", static_cast<int64_t>(health.total_records())),
                     strata::observability::IntField("degraded", static_cast<int64_t>(health.degraded_records())),
                     strata::observability::IntField("pending_repairs", static_cast<int64_t>(health.pending_repairs()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STRATA_LOG_INFO("Shutting down strata engine");

    engine->Stop();
    engine.reset();
    strata::observability::ShutdownLogging();
    strata::observability::ShutdownMetrics();
    strata::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR("Fatal error", {strata::observability::StringField("error", e.what())});
    strata::observability::ShutdownLogging();
    strata::observability::ShutdownMetrics();
    strata::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
