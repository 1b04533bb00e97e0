#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tally::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tally_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestSqliteAndSyncSettingsAreLoaded() {
  const auto yaml_path = WriteYaml("sqlite_sync",
                                   R"(database:
  sqlite:
    path: "/var/lib/tally/local.db"
    wal_mode: true
remote:
  memory: {}
sync:
  batch_size: 20
  max_attempts: 5
  retry_delays_ms: [250, 500, 750]
  poll_interval_ms: 15000
credentials:
  directory: "/var/lib/tally/credentials"
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/tally/local.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.remote().has_memory());

  assert(config.sync().batch_size() == 20);
  assert(config.sync().max_attempts() == 5);
  assert(config.sync().retry_delays_ms_size() == 3);
  assert(config.sync().retry_delays_ms(2) == 750);
  assert(config.sync().poll_interval_ms() == 15000);
  // not given: default
  assert(config.sync().sale_lock_wait_ms() == tally::config::kDefaultSaleLockWaitMs);

  assert(config.credentials().directory() == "/var/lib/tally/credentials");
  assert(config.logging().level() == "debug");
}

void TestEmptyConfigFallsBackToDefaults() {
  const auto yaml_path = WriteYaml("defaults", "logging:\n  level: \"info\"\n");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.remote().has_memory());
  assert(config.sync().batch_size() == tally::config::kDefaultBatchSize);
  assert(config.sync().max_attempts() == tally::config::kDefaultMaxAttempts);
  assert(config.sync().retry_delays_ms_size() == 5);
  assert(config.sync().retry_delays_ms(0) == 1000);
  assert(config.sync().retry_delays_ms(4) == 30000);
  assert(config.sync().poll_interval_ms() == tally::config::kDefaultPollIntervalMs);
  assert(config.credentials().directory().empty());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\tally\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\tally\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestSqlitePathIsRequired() {
  const auto yaml_path = WriteYaml("sqlite_without_path",
                                   R"(database:
  sqlite:
    wal_mode: true
)");

  assert(LoadThrows(yaml_path));
}

void TestPostgresUriIsRequired() {
  const auto yaml_path = WriteYaml("postgres_without_uri",
                                   R"(remote:
  postgres:
    max_connections: 4
)");

  assert(LoadThrows(yaml_path));
}

void TestMetricsSectionIsLoaded() {
  const auto yaml_path = WriteYaml("metrics",
                                   R"(metrics:
  enabled: true
  otlp_endpoint: "http://collector:4318/v1/metrics"
  transport: "OTLP_TRANSPORT_HTTP"
  collection_interval_ms: 5000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.metrics().enabled());
  assert(config.metrics().otlp_endpoint() == "http://collector:4318/v1/metrics");
  assert(config.metrics().transport() == tally::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.metrics().collection_interval_ms() == 5000);
  assert(config.metrics().export_timeout_ms() == 0);
}

void TestQuotedScalarsStayText() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(database:
  sqlite:
    path: "2024"
    wal_mode: TRUE
metrics:
  otlp_endpoint: ""
  collection_interval_ms: 2500
logging:
  level: 'true'
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "2024");
  assert(config.database().sqlite().wal_mode());
  assert(config.metrics().otlp_endpoint().empty());
  assert(config.metrics().collection_interval_ms() == 2500);
  assert(config.logging().level() == "true");
}

void TestEmptyFileIsAllDefaults() {
  const auto yaml_path = WriteYaml("empty_file", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.sync().batch_size() == tally::config::kDefaultBatchSize);
}

void TestErrorsNameFileAndKey() {
  const auto list_root = WriteYaml("list_root", "- database\n- remote\n");
  try {
    (void)ConfigLoader::LoadFromYaml(list_root.string());
    assert(false && "a sequence at the top level must be rejected");
  } catch (const std::runtime_error& e) {
    const std::string message = e.what();
    assert(message.find(list_root.string()) != std::string::npos);
    assert(message.find("top level must be a mapping") != std::string::npos);
  }

  const auto complex_key = WriteYaml("complex_key",
                                     R"(sync:
  ? [a, b]
  : 1
)");
  try {
    (void)ConfigLoader::LoadFromYaml(complex_key.string());
    assert(false && "a non-scalar key must be rejected");
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()).find("sync: keys must be plain strings") != std::string::npos);
  }
}

void TestMissingFileIsReported() {
  assert(LoadThrows(std::filesystem::temp_directory_path() / "tally_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestSqliteAndSyncSettingsAreLoaded();
  TestEmptyConfigFallsBackToDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestSqlitePathIsRequired();
  TestPostgresUriIsRequired();
  TestMetricsSectionIsLoaded();
  TestQuotedScalarsStayText();
  TestEmptyFileIsAllDefaults();
  TestErrorsNameFileAndKey();
  TestMissingFileIsReported();

  std::cout << "tally_unit_config_loader: pass\n";
  return 0;
}
