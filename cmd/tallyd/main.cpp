#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using tally::observability::IntField;
using tally::observability::StringField;

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
    std::cerr << "Usage: tallyd <config.yaml> OR tallyd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tally::config::ConfigLoader::LoadFromYaml(config_path);

    tally::observability::InitializeLogging(config);
    tally::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build runtime and open local storage
    // ------------------------------------------------------------
    auto runtime = tally::factory::Build(config, nullptr);
    runtime.storage->Init();

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime.worker->Start();
    runtime.worker->TriggerNow();

    const auto stats = runtime.dispatcher->GetSyncStats();
    TALLY_LOG_INFO("tallyd started", {StringField("config", config_path),
                                      IntField("pending_operations", static_cast<int64_t>(stats.pending_operations))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TALLY_LOG_INFO("Shutting down tallyd");

    runtime.worker->Stop();
    tally::observability::ShutdownMetrics();
    tally::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TALLY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    tally::observability::ShutdownMetrics();
    tally::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
