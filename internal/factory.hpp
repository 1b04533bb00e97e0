#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/credentials/credential_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/records/record_repository.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/storage/storage_facade.hpp"
#include "internal/sync/connectivity.hpp"
#include "internal/sync/sync_dispatcher.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/sync/sync_worker.hpp"

namespace tally::factory {

/*
  Runtime

  Owns every long-lived component of one process. The worker is built
  but not started.
*/
struct Runtime {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<credentials::CredentialStore> credentials;
  std::shared_ptr<records::RecordRepository>    records;
  std::shared_ptr<sync::SyncQueue>              queue;
  std::shared_ptr<storage::StorageFacade>       storage;
  std::shared_ptr<remote::RemoteStore>          remote;
  std::shared_ptr<sync::SyncDispatcher>         dispatcher;
  std::shared_ptr<sync::ConnectivityMonitor>    connectivity;
  std::shared_ptr<sync::SyncWorker>             worker;
};

/*
  Composition root. The only place that names concrete backends.
  Defaults are applied to a copy of the config first.
*/
Runtime Build(const tally::runtime::config::RuntimeConfig& config, std::shared_ptr<sync::ConnectivityMonitor> connectivity);

} // namespace tally::factory
