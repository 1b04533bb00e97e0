#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/credentials/file_credential_store.hpp"
#include "internal/credentials/memory_credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/remote/memory/memory_remote_store.hpp"
#include "internal/sync/retry_policy.hpp"
#if TALLY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TALLY_REMOTE_POSTGRES
#include "internal/remote/postgres/pg_pool.hpp"
#include "internal/remote/postgres/pg_remote_store.hpp"
#endif

namespace tally::factory {

namespace {

using tally::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TALLY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<remote::RemoteStore> BuildRemote(const RuntimeConfig& config) {
  const auto& remote = config.remote();
  if (remote.has_postgres()) {
#if TALLY_REMOTE_POSTGRES
    auto pool = std::make_shared<remote::postgres::PgPool>(remote.postgres().connection_uri(), remote.postgres().max_connections());
    return std::make_shared<remote::postgres::PgRemoteStore>(std::move(pool));
#else
    throw std::runtime_error("postgres remote requested but not enabled at build time");
#endif
  }

  return std::make_shared<remote::memory::MemoryRemoteStore>();
}

std::shared_ptr<credentials::CredentialStore> BuildCredentials(const RuntimeConfig& config) {
  const auto& directory = config.credentials().directory();
  if (directory.empty()) return std::make_shared<credentials::MemoryCredentialStore>();
  return std::make_shared<credentials::FileCredentialStore>(directory);
}

sync::RetryPolicy BuildRetryPolicy(const tally::runtime::config::SyncConfig& sync) {
  std::vector<std::chrono::milliseconds> schedule;
  for (auto delay : sync.retry_delays_ms()) schedule.emplace_back(delay);
  return sync::RetryPolicy(std::move(schedule));
}

} // namespace

Runtime Build(const RuntimeConfig& config, std::shared_ptr<sync::ConnectivityMonitor> connectivity) {
  auto resolved = config;
  config::ConfigLoader::ApplyDefaults(resolved);
  const auto& sync_config = resolved.sync();

  Runtime runtime;

  // ------------------------------------------------------------------
  // Local side
  // ------------------------------------------------------------------
  runtime.repository  = BuildRepository(resolved);
  runtime.credentials = BuildCredentials(resolved);
  runtime.records =
      std::make_shared<records::RecordRepository>(runtime.repository, std::chrono::milliseconds(sync_config.sale_lock_wait_ms()));
  runtime.queue   = std::make_shared<sync::SyncQueue>(runtime.repository, static_cast<int32_t>(sync_config.max_attempts()));
  runtime.storage = std::make_shared<storage::StorageFacade>(runtime.repository, runtime.records, runtime.queue, runtime.credentials);

  // ------------------------------------------------------------------
  // Sync engine
  // ------------------------------------------------------------------
  runtime.remote     = BuildRemote(resolved);
  runtime.dispatcher = std::make_shared<sync::SyncDispatcher>(runtime.records, runtime.queue, runtime.remote, BuildRetryPolicy(sync_config),
                                                              sync_config.batch_size());

  runtime.connectivity = connectivity ? std::move(connectivity) : std::make_shared<sync::ManualConnectivityMonitor>(true);
  runtime.worker       = std::make_shared<sync::SyncWorker>(runtime.dispatcher, runtime.connectivity,
                                                      std::chrono::milliseconds(sync_config.poll_interval_ms()));

  return runtime;
}

} // namespace tally::factory
