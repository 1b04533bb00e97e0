#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  tallyctl <config.yaml> stats\n"
            << "  tallyctl <config.yaml> pending\n"
            << "  tallyctl <config.yaml> drain\n"
            << "  tallyctl <config.yaml> clear-failed\n";
}

static void PrintStats(tally::factory::Runtime& runtime) {
  const auto sync    = runtime.dispatcher->GetSyncStats();
  const auto storage = runtime.storage->GetStorageStats();

  std::cout << "pending_operations=" << sync.pending_operations << "\n"
            << "failed_operations=" << sync.failed_operations << "\n"
            << "retryable_operations=" << sync.retryable_operations << "\n"
            << "is_processing=" << (sync.is_processing ? "true" : "false") << "\n"
            << "last_processed_ms=" << (sync.last_processed_ms ? std::to_string(*sync.last_processed_ms) : "never") << "\n";

  for (const auto& [table, rows] : storage.table_rows) {
    std::cout << "rows." << table << "=" << rows << "\n";
  }
  std::cout << "cached_entries=" << storage.cached_entries << "\n";
}

static void PrintPending(tally::factory::Runtime& runtime) {
  for (const auto& entry : runtime.queue->ListPending()) {
    std::cout << entry.id << "\t" << entry.operation_key << "\t" << entry.attempts << "/" << entry.max_attempts << "\t"
              << (entry.Exhausted() ? "exhausted" : "pending");
    if (entry.error_message) std::cout << "\t" << *entry.error_message;
    std::cout << "\n";
  }
}

static void PrintDrain(tally::factory::Runtime& runtime) {
  const auto report = runtime.dispatcher->Drain();
  if (report.already_in_progress) {
    std::cout << "already in progress\n";
    return;
  }

  std::cout << "processed=" << report.processed << " succeeded=" << report.succeeded << " failed=" << report.failed << "\n";
  for (const auto& error : report.errors) {
    std::cout << (error.permanent ? "permanent " : "retry ") << error.operation_key << ": " << error.message << "\n";
  }
  if (report.retry_after) std::cout << "retry_after_ms=" << report.retry_after->count() << "\n";
}

int main(int argc, char** argv) {
  if (argc != 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  try {
    auto config = tally::config::ConfigLoader::LoadFromYaml(config_path);
    tally::observability::InitializeLogging(config);

    auto runtime = tally::factory::Build(config, nullptr);
    runtime.storage->Init();

    if (command == "stats") {
      PrintStats(runtime);
    } else if (command == "pending") {
      PrintPending(runtime);
    } else if (command == "drain") {
      PrintDrain(runtime);
    } else if (command == "clear-failed") {
      std::cout << "cleared=" << runtime.dispatcher->ClearFailedOperations() << "\n";
    } else {
      Usage();
      tally::observability::ShutdownLogging();
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    tally::observability::ShutdownLogging();
    return 2;
  }

  tally::observability::ShutdownLogging();
  return 0;
}
