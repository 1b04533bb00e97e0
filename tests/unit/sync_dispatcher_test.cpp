#include "internal/sync/sync_dispatcher.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/credentials/memory_credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/remote/memory/memory_remote_store.hpp"
#include "internal/storage/storage_facade.hpp"

namespace {

using std::chrono::milliseconds;
using tally::db::memory::MemoryRepository;
using tally::db::model::ExpenseRecord;
using tally::db::model::Identifier;
using tally::db::model::InventoryRecord;
using tally::db::model::OperationType;
using tally::db::model::ProfileRecord;
using tally::records::InventoryChanges;
using tally::records::RecordRepository;
using tally::records::SaleLineRequest;
using tally::records::SaleRequest;
using tally::remote::RemoteCode;
using tally::remote::RemoteResult;
using tally::remote::RemoteStore;
using tally::remote::Row;
using tally::remote::memory::MemoryRemoteStore;
using tally::storage::StorageFacade;
using tally::sync::OperationKey;
using tally::sync::SyncDispatcher;
using tally::sync::SyncQueue;

// Forwards to an in-memory backend unless told to fail.
class ScriptedRemote final : public RemoteStore {
 public:
  explicit ScriptedRemote(std::shared_ptr<MemoryRemoteStore> inner) : inner_(std::move(inner)) {
  }

  std::atomic<bool>                       offline{false};
  std::set<std::string>                   rejected_tables;
  std::function<void(const std::string&)> before_insert;

  RemoteResult Insert(const std::string& table, const Row& row) override {
    if (auto failure = Check(table)) return *failure;
    if (before_insert) before_insert(table);
    return inner_->Insert(table, row);
  }

  RemoteResult InsertMany(const std::string& table, const std::vector<Row>& rows) override {
    if (auto failure = Check(table)) return *failure;
    return inner_->InsertMany(table, rows);
  }

  RemoteResult Update(const std::string& table, const std::string& id, const Row& row) override {
    if (auto failure = Check(table)) return *failure;
    return inner_->Update(table, id, row);
  }

  RemoteResult Delete(const std::string& table, const std::string& id) override {
    if (auto failure = Check(table)) return *failure;
    return inner_->Delete(table, id);
  }

  RemoteResult Upsert(const std::string& table, const Row& row) override {
    if (auto failure = Check(table)) return *failure;
    return inner_->Upsert(table, row);
  }

  RemoteResult Fetch(const std::string& table, const std::string& id) override {
    if (auto failure = Check(table)) return *failure;
    return inner_->Fetch(table, id);
  }

 private:
  std::optional<RemoteResult> Check(const std::string& table) const {
    if (offline.load()) return RemoteResult::Err(RemoteCode::Unavailable, "network unreachable");
    if (rejected_tables.count(table)) return RemoteResult::Err(RemoteCode::Rejected, "permission denied for " + table);
    return std::nullopt;
  }

  std::shared_ptr<MemoryRemoteStore> inner_;
};

struct Harness {
  std::shared_ptr<MemoryRepository>  store   = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordRepository>  records = std::make_shared<RecordRepository>(store);
  std::shared_ptr<SyncQueue>         queue   = std::make_shared<SyncQueue>(store, 3);
  std::shared_ptr<MemoryRemoteStore> backend = std::make_shared<MemoryRemoteStore>();
  std::shared_ptr<ScriptedRemote>    remote  = std::make_shared<ScriptedRemote>(backend);

  StorageFacade  storage{store, records, queue, std::make_shared<tally::credentials::MemoryCredentialStore>()};
  SyncDispatcher dispatcher{records, queue, remote};

  InventoryRecord AddItem(const std::string& name, int64_t quantity, double price) {
    InventoryRecord item;
    item.user_id       = "u1";
    item.name          = name;
    item.quantity      = quantity;
    item.selling_price = price;
    return storage.StoreInventoryItem(item);
  }

  std::optional<InventoryRecord> Local(const std::string& id_or_temp) {
    return storage.FindInventoryItemByTempId(id_or_temp);
  }

  Row RemoteInventory(const std::string& id) {
    auto fetched = backend->Fetch(tally::remote::kInventoryTable, id);
    assert(fetched.ok());
    return fetched.row;
  }
};

void TestInventoryInsertRekeysLocalRow() {
  Harness h;
  auto    item = h.AddItem("Rice", 10, 2.5);

  auto report = h.dispatcher.Drain();
  assert(!report.already_in_progress);
  assert(report.processed == 1);
  assert(report.succeeded == 1);
  assert(report.failed == 0);
  assert(!report.retry_after.has_value());

  auto local = h.Local(item.id.Value());
  assert(local.has_value());
  assert(local->id.IsPersistent());
  assert(local->temp_id == item.id.Value());
  assert(local->synced);
  assert(!local->is_offline);

  auto remote = h.RemoteInventory(local->id.Value());
  assert(tally::remote::GetString(remote, "client_ref") == std::optional<std::string>(item.id.Value()));
  assert(tally::remote::GetInt(remote, "quantity") == std::optional<int64_t>(10));

  auto stats = h.dispatcher.GetSyncStats();
  assert(stats.pending_operations == 0);
  assert(stats.last_processed_ms.has_value());
  assert(!stats.is_processing);
}

void TestEmptyQueueDrainsNothing() {
  Harness h;
  auto    report = h.dispatcher.Drain();
  assert(report.processed == 0);
  assert(!h.dispatcher.GetSyncStats().last_processed_ms.has_value());
}

void TestTransientFailuresBackOffThenExhaust() {
  Harness h;
  h.AddItem("Rice", 10, 2.5);
  h.remote->offline = true;

  auto first = h.dispatcher.Drain();
  assert(first.failed == 1);
  assert(first.errors.size() == 1);
  assert(!first.errors[0].permanent);
  assert(first.retry_after == std::optional<milliseconds>(milliseconds(1000)));

  auto second = h.dispatcher.Drain();
  assert(second.retry_after == std::optional<milliseconds>(milliseconds(2000)));

  auto third = h.dispatcher.Drain();
  assert(third.failed == 1);
  assert(!third.retry_after.has_value());

  auto stats = h.dispatcher.GetSyncStats();
  assert(stats.pending_operations == 1);
  assert(stats.failed_operations == 1);
  assert(stats.retryable_operations == 0);

  // exhausted entries are not retried, even once the network is back
  h.remote->offline = false;
  assert(h.dispatcher.Drain().processed == 0);
  assert(h.backend->Count(tally::remote::kInventoryTable) == 0);

  assert(h.dispatcher.ClearFailedOperations() == 1);
  assert(h.dispatcher.GetSyncStats().pending_operations == 0);
}

void TestMalformedEntryFailsPermanently() {
  Harness h;
  h.queue->Enqueue(OperationKey("inventory", OperationType::kInsert, "x"), "inventory", "x", OperationType::kInsert, "not a protobuf");
  h.queue->Enqueue(OperationKey("widgets", OperationType::kInsert, "y"), "widgets", "y", OperationType::kInsert, "");

  auto report = h.dispatcher.Drain();
  assert(report.processed == 2);
  assert(report.failed == 2);
  assert(report.errors[0].permanent);
  assert(report.errors[1].permanent);
  assert(!report.retry_after.has_value());

  assert(h.dispatcher.GetSyncStats().failed_operations == 2);
}

void TestSaleResolvesTemporaryInventory() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10, 5.0);

  SaleRequest request;
  request.user_id = "u1";
  auto sale       = h.storage.StoreSale(request, {SaleLineRequest{rice.id.Value(), 3, std::nullopt, std::nullopt}});

  auto report = h.dispatcher.Drain();
  assert(report.succeeded == 2);

  auto local_item = h.Local(rice.id.Value());
  assert(local_item.has_value() && local_item->id.IsPersistent());
  const auto remote_inventory_id = local_item->id.Value();

  auto sales = h.backend->Rows(tally::remote::kSalesTable);
  assert(sales.size() == 1);
  const auto remote_sale_id = *tally::remote::GetString(sales[0], "id");
  assert(tally::remote::GetString(sales[0], "client_ref") == std::optional<std::string>(sale.sale.id.Value()));

  auto items = h.backend->Rows(tally::remote::kSaleItemsTable);
  assert(items.size() == 1);
  assert(tally::remote::GetString(items[0], "sale_id") == std::optional<std::string>(remote_sale_id));
  assert(tally::remote::GetString(items[0], "inventory_id") == std::optional<std::string>(remote_inventory_id));

  // inserted with 10, then the sale took 3
  assert(tally::remote::GetInt(h.RemoteInventory(remote_inventory_id), "quantity") == std::optional<int64_t>(7));

  auto local_sales = h.storage.GetSales({"u1", "", tally::db::model::Role::kIndividual});
  assert(local_sales.size() == 1);
  assert(local_sales[0].id.Value() == remote_sale_id);
  assert(local_sales[0].temp_id == sale.sale.id.Value());
  assert(local_sales[0].synced);
}

void TestSaleWaitsForUnresolvedInventory() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10, 5.0);

  SaleRequest request;
  request.user_id = "u1";
  h.storage.StoreSale(request, {SaleLineRequest{rice.id.Value(), 1, std::nullopt, std::nullopt}});

  h.remote->rejected_tables.insert(tally::remote::kInventoryTable);
  auto report = h.dispatcher.Drain();
  assert(report.failed == 2);
  assert(report.errors[1].message == "Cannot resolve inventory reference " + rice.id.Value());
  assert(h.backend->Count(tally::remote::kSalesTable) == 0);

  h.remote->rejected_tables.clear();
  report = h.dispatcher.Drain();
  assert(report.succeeded == 2);
  assert(h.backend->Count(tally::remote::kSalesTable) == 1);
  assert(h.dispatcher.GetSyncStats().pending_operations == 0);
}

void TestUpdateReplaysOnlyUserSetQuantity() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10, 5.0);
  h.dispatcher.Drain();
  const auto id = h.Local(rice.id.Value())->id.Value();

  SaleRequest request;
  request.user_id = "u1";
  h.storage.StoreSale(request, {SaleLineRequest{id, 2, std::nullopt, std::nullopt}});

  InventoryChanges price;
  price.selling_price = 6.0;
  h.storage.UpdateInventoryItem(id, price);

  h.dispatcher.Drain();
  auto remote = h.RemoteInventory(id);
  assert(tally::remote::GetDouble(remote, "selling_price") == std::optional<double>(6.0));
  assert(tally::remote::GetInt(remote, "quantity") == std::optional<int64_t>(8));

  InventoryChanges restock;
  restock.quantity = 25;
  h.storage.UpdateInventoryItem(id, restock);
  // a later edit keeps the pending restock
  h.storage.UpdateInventoryItem(id, price);

  h.dispatcher.Drain();
  assert(tally::remote::GetInt(h.RemoteInventory(id), "quantity") == std::optional<int64_t>(25));
  assert(h.Local(rice.id.Value())->quantity == 25);
}

void TestDeleteRemovesRemoteRow() {
  Harness h;
  auto    rice  = h.AddItem("Rice", 10, 5.0);
  auto    draft = h.AddItem("Draft", 1, 1.0);

  h.storage.DeleteInventoryItem(draft.id.Value());
  assert(!h.queue->Get(OperationKey("inventory", OperationType::kInsert, draft.id.Value())).has_value());

  h.dispatcher.Drain();
  assert(h.backend->Count(tally::remote::kInventoryTable) == 1);

  const auto id = h.Local(rice.id.Value())->id.Value();
  h.storage.DeleteInventoryItem(id);
  auto report = h.dispatcher.Drain();
  assert(report.succeeded == 1);
  assert(h.backend->Count(tally::remote::kInventoryTable) == 0);
}

void TestEditDuringFlightStaysPendingWithoutDuplicates() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10, 5.0);

  bool edited         = false;
  h.remote->before_insert = [&](const std::string& table) {
    if (edited || table != tally::remote::kInventoryTable) return;
    edited = true;
    InventoryChanges rename;
    rename.name = "Basmati rice";
    h.storage.UpdateInventoryItem(rice.id.Value(), rename);
  };

  auto first = h.dispatcher.Drain();
  assert(first.succeeded == 1);
  assert(h.dispatcher.GetSyncStats().pending_operations == 1);

  auto second = h.dispatcher.Drain();
  assert(second.succeeded == 1);
  assert(h.dispatcher.GetSyncStats().pending_operations == 0);

  auto rows = h.backend->Rows(tally::remote::kInventoryTable);
  assert(rows.size() == 1);
  assert(tally::remote::GetString(rows[0], "name") == std::optional<std::string>("Basmati rice"));
  assert(h.Local(rice.id.Value())->id.Value() == *tally::remote::GetString(rows[0], "id"));
}

void TestExpenseLifecycleSyncs() {
  Harness h;

  ExpenseRecord expense;
  expense.user_id = "u1";
  expense.title   = "Rent";
  expense.amount  = 100;
  auto stored     = h.storage.StoreExpense(expense);

  h.dispatcher.Drain();
  auto rows = h.backend->Rows(tally::remote::kExpensesTable);
  assert(rows.size() == 1);
  const auto remote_id = *tally::remote::GetString(rows[0], "id");

  tally::records::ExpenseChanges changes;
  changes.amount = 120;
  auto updated   = h.storage.UpdateExpense(stored.id.Value(), changes);
  assert(updated.id.Value() == remote_id);

  h.dispatcher.Drain();
  auto fetched = h.backend->Fetch(tally::remote::kExpensesTable, remote_id);
  assert(tally::remote::GetDouble(fetched.row, "amount") == std::optional<double>(120));

  h.storage.DeleteExpense(remote_id);
  h.dispatcher.Drain();
  assert(h.backend->Count(tally::remote::kExpensesTable) == 0);
  assert(h.dispatcher.GetSyncStats().pending_operations == 0);
}

void TestProfileUpsertsByUserId() {
  Harness h;

  ProfileRecord profile;
  profile.user_id       = "u1";
  profile.business_name = "Corner Shop";
  h.storage.StoreUserProfile(profile);
  h.dispatcher.Drain();

  profile.business_name = "Corner Shop Ltd";
  h.storage.StoreUserProfile(profile);
  h.dispatcher.Drain();

  auto rows = h.backend->Rows(tally::remote::kProfilesTable);
  assert(rows.size() == 1);
  assert(tally::remote::GetString(rows[0], "business_name") == std::optional<std::string>("Corner Shop Ltd"));
  assert(h.storage.GetUserProfile("u1")->synced);
}

void TestDrainIsSingleFlight() {
  Harness h;
  h.AddItem("Rice", 10, 5.0);

  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  h.remote->before_insert = [&](const std::string&) {
    entered = true;
    while (!release.load()) std::this_thread::sleep_for(milliseconds(1));
  };

  tally::sync::DrainReport background;
  std::thread              worker([&] { background = h.dispatcher.Drain(); });

  while (!entered.load()) std::this_thread::sleep_for(milliseconds(1));

  assert(h.dispatcher.IsProcessing());
  assert(h.dispatcher.GetSyncStats().is_processing);
  auto overlapping = h.dispatcher.Drain();
  assert(overlapping.already_in_progress);
  assert(overlapping.processed == 0);

  release = true;
  worker.join();

  assert(background.succeeded == 1);
  assert(!h.dispatcher.IsProcessing());
}

void TestBatchLimit() {
  Harness h;
  for (int i = 0; i < 5; ++i) h.AddItem("Item " + std::to_string(i), 1, 1.0);

  auto report = h.dispatcher.Drain(2);
  assert(report.processed == 2);
  assert(h.dispatcher.GetSyncStats().pending_operations == 3);
  assert(h.dispatcher.BatchSize() == 50);
}

} // namespace

int main() {
  TestInventoryInsertRekeysLocalRow();
  TestEmptyQueueDrainsNothing();
  TestTransientFailuresBackOffThenExhaust();
  TestMalformedEntryFailsPermanently();
  TestSaleResolvesTemporaryInventory();
  TestSaleWaitsForUnresolvedInventory();
  TestUpdateReplaysOnlyUserSetQuantity();
  TestDeleteRemovesRemoteRow();
  TestEditDuringFlightStaysPendingWithoutDuplicates();
  TestExpenseLifecycleSyncs();
  TestProfileUpsertsByUserId();
  TestDrainIsSingleFlight();
  TestBatchLimit();

  std::cout << "tally_unit_sync_dispatcher: pass\n";
  return 0;
}
