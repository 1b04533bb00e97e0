#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/factory.hpp"
#include "internal/remote/memory/memory_remote_store.hpp"
#include "internal/util/errors.hpp"

#if TALLY_DB_SQLITE
#include <unistd.h>
#endif

namespace {

using tally::db::model::Identifier;
using tally::db::model::InventoryRecord;
using tally::db::model::Role;
using tally::records::RecordScope;
using tally::records::SaleLineRequest;
using tally::records::SaleOutcome;
using tally::records::SaleRequest;
using tally::remote::RemoteCode;
using tally::remote::RemoteResult;
using tally::remote::RemoteStore;
using tally::remote::Row;
using tally::remote::memory::MemoryRemoteStore;
using tally::sync::SyncDispatcher;

// Tables listed in `down` answer Unavailable; everything else is forwarded.
class PartialOutage final : public RemoteStore {
 public:
  PartialOutage(std::shared_ptr<RemoteStore> inner, std::set<std::string> down) : inner_(std::move(inner)), down_(std::move(down)) {
  }

  RemoteResult Insert(const std::string& table, const Row& row) override {
    if (Down(table)) return Outage(table);
    return inner_->Insert(table, row);
  }

  RemoteResult InsertMany(const std::string& table, const std::vector<Row>& rows) override {
    if (Down(table)) return Outage(table);
    return inner_->InsertMany(table, rows);
  }

  RemoteResult Update(const std::string& table, const std::string& id, const Row& row) override {
    if (Down(table)) return Outage(table);
    return inner_->Update(table, id, row);
  }

  RemoteResult Delete(const std::string& table, const std::string& id) override {
    if (Down(table)) return Outage(table);
    return inner_->Delete(table, id);
  }

  RemoteResult Upsert(const std::string& table, const Row& row) override {
    if (Down(table)) return Outage(table);
    return inner_->Upsert(table, row);
  }

  RemoteResult Fetch(const std::string& table, const std::string& id) override {
    if (Down(table)) return Outage(table);
    return inner_->Fetch(table, id);
  }

 private:
  bool Down(const std::string& table) const {
    return down_.count(table) > 0;
  }

  static RemoteResult Outage(const std::string& table) {
    return RemoteResult::Err(RemoteCode::Unavailable, "connection reset while writing " + table);
  }

  std::shared_ptr<RemoteStore> inner_;
  std::set<std::string>        down_;
};

std::string NextDatabasePath() {
  static int counter = 0;
#if TALLY_DB_SQLITE
  const auto name = "tally_offline_sync_" + std::to_string(::getpid()) + "_" + std::to_string(++counter) + ".db";
#else
  const auto name = "tally_offline_sync_" + std::to_string(++counter) + ".db";
#endif
  return (std::filesystem::temp_directory_path() / name).string();
}

// One application instance: local store on disk when available, remote in
// memory, worker not started.
struct App {
  std::string               db_path;
  tally::factory::Runtime   runtime;
  std::shared_ptr<MemoryRemoteStore> backend;

  App() : db_path(NextDatabasePath()) {
    tally::runtime::config::RuntimeConfig config;
#if TALLY_DB_SQLITE
    std::filesystem::remove(db_path);
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
#else
    config.mutable_database()->mutable_memory();
#endif
    config.mutable_remote()->mutable_memory();

    runtime = tally::factory::Build(config, nullptr);
    backend = std::dynamic_pointer_cast<MemoryRemoteStore>(runtime.remote);
    assert(backend);
    runtime.storage->Init();
  }

  ~App() {
    runtime = tally::factory::Runtime{};
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  }

  InventoryRecord AddItem(Identifier id, const std::string& name, int64_t quantity) {
    InventoryRecord item;
    item.id            = std::move(id);
    item.user_id       = "u1";
    item.name          = name;
    item.quantity      = quantity;
    item.selling_price = 4.0;
    return runtime.storage->StoreInventoryItem(item);
  }

  SaleOutcome Sell(const std::string& inventory_id, int64_t quantity) {
    SaleRequest request;
    request.user_id        = "u1";
    request.payment_method = "cash";
    return runtime.storage->StoreSale(request, {SaleLineRequest{inventory_id, quantity, std::nullopt, std::nullopt}});
  }

  std::optional<int64_t> RemoteQuantity(const std::string& id) {
    auto fetched = backend->Fetch(tally::remote::kInventoryTable, id);
    if (!fetched.ok()) return std::nullopt;
    return tally::remote::GetInt(fetched.row, "quantity");
  }

  InventoryRecord Local(const std::string& temp_id) {
    auto row = runtime.storage->FindInventoryItemByTempId(temp_id);
    assert(row.has_value());
    return *row;
  }

  int64_t LocalQuantity(const std::string& temp_id) {
    return Local(temp_id).quantity;
  }

  void SetQuantity(const std::string& id, int64_t quantity) {
    tally::records::InventoryChanges changes;
    changes.quantity = quantity;
    runtime.storage->UpdateInventoryItem(id, changes);
  }

  void Rename(const std::string& id, const std::string& name) {
    tally::records::InventoryChanges changes;
    changes.name = name;
    runtime.storage->UpdateInventoryItem(id, changes);
  }
};

// Scenario: an item created offline is confirmed and re-keyed.
void TestOfflineInsertIsConfirmed() {
  App app;
  app.AddItem(Identifier::Temporary("temp_1"), "Rice", 10);

  auto report = app.runtime.dispatcher->Drain();
  assert(report.processed == 1);
  assert(report.succeeded == 1);

  auto local = app.runtime.storage->FindInventoryItemByTempId("temp_1");
  assert(local.has_value());
  assert(local->id.IsPersistent());
  assert(local->id.Value() != "temp_1");
  assert(local->temp_id == "temp_1");
  assert(local->synced);

  assert(app.RemoteQuantity(local->id.Value()) == std::optional<int64_t>(10));
  assert(app.runtime.queue->Counts().pending == 0);
}

// Scenario: a sale made against an unsynced item waits until the item
// has a persistent id, then decrements the remote stock.
void TestSaleWaitsForItsInventory() {
  App app;
  app.AddItem(Identifier::Temporary("temp_1"), "Rice", 10);
  auto sale = app.Sell("temp_1", 3);
  assert(app.LocalQuantity("temp_1") == 7);

  SyncDispatcher inventory_down(app.runtime.records, app.runtime.queue,
                                std::make_shared<PartialOutage>(app.runtime.remote, std::set<std::string>{tally::remote::kInventoryTable}));

  auto blocked = inventory_down.Drain();
  assert(blocked.processed == 2);
  assert(blocked.failed == 2);
  assert(blocked.errors[1].message == "Cannot resolve inventory reference temp_1");

  auto pending_sale = app.runtime.queue->Get(tally::sync::OperationKey("sales", tally::db::model::OperationType::kInsert, sale.sale.id.Value()));
  assert(pending_sale.has_value());
  assert(pending_sale->attempts == 1);
  assert(!pending_sale->synced);
  assert(app.backend->Count(tally::remote::kSalesTable) == 0);

  // inventory first, then the sale
  auto first = app.runtime.dispatcher->Drain(1);
  assert(first.succeeded == 1);
  const auto remote_id = app.runtime.storage->FindInventoryItemByTempId("temp_1")->id.Value();
  assert(app.RemoteQuantity(remote_id) == std::optional<int64_t>(10));

  auto second = app.runtime.dispatcher->Drain();
  assert(second.succeeded == 1);
  assert(app.RemoteQuantity(remote_id) == std::optional<int64_t>(7));
  assert(app.backend->Count(tally::remote::kSalesTable) == 1);
  assert(app.backend->Count(tally::remote::kSaleItemsTable) == 1);
  assert(app.runtime.dispatcher->GetSyncStats().pending_operations == 0);
  assert(app.Local("temp_1").synced);
}

// Scenario: stock is counted and corrected while a sale of the same item
// is still offline. The count is what both sides end up with.
void TestRecountAfterOfflineSaleReachesRemote() {
  App app;
  app.AddItem(Identifier::Temporary("temp_1"), "Rice", 10);
  app.Sell("temp_1", 3);
  app.SetQuantity("temp_1", 20);
  assert(app.LocalQuantity("temp_1") == 20);

  auto report = app.runtime.dispatcher->Drain();
  assert(report.failed == 0);
  assert(report.succeeded == 3);

  auto local = app.Local("temp_1");
  assert(local.id.IsPersistent());
  assert(local.quantity == 20);
  assert(app.RemoteQuantity(local.id.Value()) == std::optional<int64_t>(20));
  assert(local.synced);
  assert(app.runtime.queue->Counts().pending == 0);

  // selling again after the recount, still offline
  app.AddItem(Identifier::Temporary("temp_2"), "Salt", 10);
  app.Sell("temp_2", 3);
  app.SetQuantity("temp_2", 20);
  app.Sell("temp_2", 2);
  app.Rename("temp_2", "Sea salt");
  assert(app.LocalQuantity("temp_2") == 18);

  report = app.runtime.dispatcher->Drain();
  assert(report.failed == 0);

  const auto salt = app.Local("temp_2");
  assert(app.RemoteQuantity(salt.id.Value()) == std::optional<int64_t>(18));
  assert(salt.quantity == 18);
  assert(salt.name == "Sea salt");
  assert(app.runtime.queue->Counts().pending == 0);
}

// Scenario: the same recount on an item that is already on the server,
// with an earlier edit still queued ahead of the sale.
void TestRecountOfSyncedItemReachesRemote() {
  App app;
  app.AddItem(Identifier::Temporary("temp_1"), "Oil", 10);
  assert(app.runtime.dispatcher->Drain().succeeded == 1);
  const auto id = app.Local("temp_1").id.Value();

  app.Rename(id, "Olive oil");
  app.Sell(id, 3);
  app.SetQuantity(id, 20);

  auto report = app.runtime.dispatcher->Drain();
  assert(report.failed == 0);
  assert(report.succeeded == 2);

  auto local = app.Local("temp_1");
  assert(local.quantity == 20);
  assert(app.RemoteQuantity(id) == std::optional<int64_t>(20));
  assert(local.synced);

  auto fetched = app.backend->Fetch(tally::remote::kInventoryTable, id);
  assert(tally::remote::GetString(fetched.row, "name") == std::optional<std::string>("Olive oil"));
}

// Scenario: an item sold some time after it was created offline ends up
// in sync once both entries have been replayed.
void TestSoldItemSettlesAfterDrain() {
  App app;
  app.AddItem(Identifier::Temporary("temp_2"), "Tea", 10);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  app.Sell("temp_2", 3);

  auto report = app.runtime.dispatcher->Drain();
  assert(report.succeeded == 2);

  auto local = app.Local("temp_2");
  assert(local.synced);
  assert(local.quantity == 7);
  assert(app.RemoteQuantity(local.id.Value()) == std::optional<int64_t>(7));
  assert(app.runtime.queue->Counts().pending == 0);
}

// Scenario: a sale that lands before a queued edit does not mark the item
// synced; the edit does.
void TestQueuedEditKeepsItemUnsynced() {
  App app;
  app.AddItem(Identifier::Temporary("temp_3"), "Coffee", 10);
  app.runtime.dispatcher->Drain();
  const auto id = app.Local("temp_3").id.Value();

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  app.Sell(id, 2);
  app.Rename(id, "Arabica");

  assert(app.runtime.dispatcher->Drain(1).succeeded == 1);
  assert(app.RemoteQuantity(id) == std::optional<int64_t>(8));
  assert(!app.Local("temp_3").synced);

  assert(app.runtime.dispatcher->Drain().succeeded == 1);
  assert(app.Local("temp_3").synced);
  assert(app.runtime.queue->Counts().pending == 0);
}

// Scenario: overselling leaves no trace locally or in the queue.
void TestOversellIsRejected() {
  App app;
  auto item          = app.AddItem(Identifier(), "Flour", 10);
  const auto pending = app.runtime.queue->Counts().pending;

  bool rejected = false;
  try {
    app.Sell(item.id.Value(), 15);
  } catch (const tally::util::InsufficientStock& e) {
    rejected = std::string(e.what()).find("Insufficient stock") != std::string::npos;
  }
  assert(rejected);

  assert(app.runtime.storage->GetSales(RecordScope{"u1", "", Role::kIndividual}).empty());
  auto stats = app.runtime.storage->GetStorageStats();
  assert(stats.table_rows.at("sales") == 0);
  assert(stats.table_rows.at("sale_items") == 0);
  assert(app.runtime.queue->Counts().pending == pending);
  assert(app.LocalQuantity(item.id.Value()) == 10);
}

// Scenario: an entry that keeps failing is exhausted, then cleared.
void TestExhaustedEntryIsCleared() {
  App app;
  app.AddItem(Identifier(), "Sugar", 4);

  SyncDispatcher offline(app.runtime.records, app.runtime.queue,
                         std::make_shared<PartialOutage>(app.runtime.remote, std::set<std::string>{tally::remote::kInventoryTable}));
  for (int i = 0; i < 3; ++i) {
    assert(offline.Drain().failed == 1);
  }

  auto stats = app.runtime.dispatcher->GetSyncStats();
  assert(stats.failed_operations == 1);
  assert(stats.retryable_operations == 0);
  assert(stats.pending_operations == 1);

  assert(app.runtime.dispatcher->ClearFailedOperations() == 1);
  assert(app.runtime.queue->ListPending().empty());
  assert(app.runtime.dispatcher->GetSyncStats().pending_operations == 0);
  assert(app.backend->Count(tally::remote::kInventoryTable) == 0);
}

// Scenario: concurrent sales never lose an update.
void TestConcurrentSalesKeepStockConsistent() {
  App app;
  auto item = app.AddItem(Identifier(), "Beans", 10);

  std::atomic<int> sold{0};
  std::atomic<int> busy{0};
  std::vector<std::thread> tills;
  for (int i = 0; i < 2; ++i) {
    tills.emplace_back([&]() {
      try {
        app.Sell(item.id.Value(), 2);
        sold.fetch_add(1);
      } catch (const tally::util::Busy&) {
        busy.fetch_add(1);
      }
    });
  }
  for (auto& t : tills) t.join();

  assert(sold.load() + busy.load() == 2);
  assert(sold.load() >= 1);
  assert(app.LocalQuantity(item.id.Value()) == 10 - 2 * sold.load());
  assert(app.runtime.storage->GetSales(RecordScope{"u1", "", Role::kIndividual}).size() == static_cast<std::size_t>(sold.load()));

  auto report = app.runtime.dispatcher->Drain();
  assert(report.failed == 0);
  const auto remote_id = app.runtime.storage->FindInventoryItemByTempId(item.id.Value())->id.Value();
  assert(app.RemoteQuantity(remote_id) == std::optional<int64_t>(10 - 2 * sold.load()));
}

} // namespace

int main() {
  TestOfflineInsertIsConfirmed();
  TestSaleWaitsForItsInventory();
  TestRecountAfterOfflineSaleReachesRemote();
  TestRecountOfSyncedItemReachesRemote();
  TestSoldItemSettlesAfterDrain();
  TestQueuedEditKeepsItemUnsynced();
  TestOversellIsRejected();
  TestExhaustedEntryIsCleared();
  TestConcurrentSalesKeepStockConsistent();

  std::cout << "tally_integration_offline_sync: pass\n";
  return 0;
}
