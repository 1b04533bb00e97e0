#include "internal/storage/storage_facade.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/credentials/memory_credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/sync/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using std::chrono::milliseconds;
using tally::db::memory::MemoryRepository;
using tally::db::model::ExpenseRecord;
using tally::db::model::Identifier;
using tally::db::model::InventoryRecord;
using tally::db::model::OperationType;
using tally::db::model::ProfileRecord;
using tally::db::model::Role;
using tally::records::InventoryChanges;
using tally::records::RecordRepository;
using tally::records::RecordScope;
using tally::records::SaleLineRequest;
using tally::records::SaleRequest;
using tally::storage::StorageFacade;
using tally::sync::OperationKey;
using tally::sync::SyncQueue;

struct Harness {
  std::shared_ptr<MemoryRepository>                       store       = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordRepository>                       records     = std::make_shared<RecordRepository>(store);
  std::shared_ptr<SyncQueue>                              queue       = std::make_shared<SyncQueue>(store);
  std::shared_ptr<tally::credentials::MemoryCredentialStore> credentials = std::make_shared<tally::credentials::MemoryCredentialStore>();
  StorageFacade                                           storage{store, records, queue, credentials};

  InventoryRecord AddItem(const std::string& name, int64_t quantity, Identifier id = {}) {
    InventoryRecord item;
    item.id            = std::move(id);
    item.user_id       = "u1";
    item.name          = name;
    item.quantity      = quantity;
    item.selling_price = 4.0;
    return storage.StoreInventoryItem(item);
  }

  // Stands in for a successful sync of the entry.
  void Complete(const std::string& key) {
    auto entry = queue->Get(key);
    assert(entry.has_value());
    auto tx = store->Begin();
    assert(queue->MarkCompleted(*tx, *entry));
    tx->Commit();
  }

  tally::v1::SyncPayload Payload(const std::string& key) {
    auto entry = queue->Get(key);
    assert(entry.has_value());
    return tally::sync::DecodePayload(*entry);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

std::string InventoryKey(OperationType type, const std::string& id) {
  return OperationKey("inventory", type, id);
}

void TestInitIsIdempotentAndLazy() {
  Harness h;
  assert(!h.storage.IsInitialized());
  h.storage.Init();
  h.storage.Init();
  assert(h.storage.IsInitialized());

  Harness lazy;
  lazy.AddItem("Rice", 1);
  assert(lazy.storage.IsInitialized());
}

void TestSecureStorage() {
  Harness h;
  h.storage.SetSecure("user_session", "session");
  h.storage.SetSecure("user_tokens", "tokens");
  h.storage.SetSecure("cached_user_session", "cached");
  h.storage.SetSecure("device_id", "device");

  assert(h.storage.GetSecure("user_session") == std::optional<std::string>("session"));
  h.storage.RemoveSecure("device_id");
  assert(!h.storage.GetSecure("device_id").has_value());

  h.storage.SetSecure("device_id", "device");
  h.storage.ClearSecureStorage();
  assert(!h.storage.GetSecure("user_session").has_value());
  assert(!h.storage.GetSecure("user_tokens").has_value());
  assert(!h.storage.GetSecure("cached_user_session").has_value());
  assert(h.storage.GetSecure("device_id") == std::optional<std::string>("device"));

  assert(Throws<tally::util::InvalidArgument>([&] { h.storage.SetSecure("../x", "v"); }));
}

void TestEditsCollapseIntoPendingInsert() {
  Harness h;
  auto    item = h.AddItem("Rice", 10);
  const auto key = InventoryKey(OperationType::kInsert, item.id.Value());
  assert(h.queue->Get(key).has_value());

  InventoryChanges rename;
  rename.name = "Basmati";
  h.storage.UpdateInventoryItem(item.id.Value(), rename);

  assert(h.queue->ListPending().size() == 1);
  auto payload = h.Payload(key);
  assert(payload.inventory_insert().item().name() == "Basmati");
  assert(payload.inventory_insert().item().quantity() == 10);
}

void TestSaleDecrementIsNotCarriedIntoPendingInsert() {
  Harness h;
  auto    item = h.AddItem("Rice", 10);

  SaleRequest request;
  request.user_id = "u1";
  h.storage.StoreSale(request, {SaleLineRequest{item.id.Value(), 4, std::nullopt, std::nullopt}});

  InventoryChanges rename;
  rename.name = "Basmati";
  auto updated = h.storage.UpdateInventoryItem(item.id.Value(), rename);
  assert(updated.quantity == 6);

  // the sale entry replays the decrement; the insert keeps the quantity it was created with
  auto payload = h.Payload(InventoryKey(OperationType::kInsert, item.id.Value()));
  assert(payload.inventory_insert().item().quantity() == 10);
  assert(payload.inventory_insert().item().name() == "Basmati");
}

void TestQuantitySetAfterUnsyncedSaleQueuesBehindIt() {
  Harness h;
  auto    item = h.AddItem("Rice", 10);

  SaleRequest request;
  request.user_id = "u1";
  auto sale       = h.storage.StoreSale(request, {SaleLineRequest{item.id.Value(), 3, std::nullopt, std::nullopt}});

  InventoryChanges restock;
  restock.quantity = 20;
  assert(h.storage.UpdateInventoryItem(item.id.Value(), restock).quantity == 20);

  const auto insert_key = InventoryKey(OperationType::kInsert, item.id.Value());
  const auto update_key = InventoryKey(OperationType::kUpdate, item.id.Value());

  auto pending = h.queue->ListPending();
  assert(pending.size() == 3);
  assert(pending[0].operation_key == insert_key);
  assert(pending[1].operation_key == OperationKey("sales", OperationType::kInsert, sale.sale.id.Value()));
  assert(pending[2].operation_key == update_key);

  assert(h.Payload(insert_key).inventory_insert().item().quantity() == 10);
  auto update = h.Payload(update_key).inventory_update();
  assert(update.target().temporary() == item.id.Value());
  assert(update.quantity_set());
  assert(update.item().quantity() == 20);

  // later edits refresh both entries in place
  InventoryChanges rename;
  rename.name = "Basmati";
  h.storage.UpdateInventoryItem(item.id.Value(), rename);

  pending = h.queue->ListPending();
  assert(pending.size() == 3);
  assert(pending[2].operation_key == update_key);
  assert(h.Payload(insert_key).inventory_insert().item().name() == "Basmati");
  assert(h.Payload(insert_key).inventory_insert().item().quantity() == 10);
  assert(h.Payload(update_key).inventory_update().item().name() == "Basmati");
  assert(h.Payload(update_key).inventory_update().item().quantity() == 20);

  // once everything but the update has landed, deleting the row drops it too
  {
    auto tx = h.store->Begin();
    h.records->ConfirmInventoryItem(*tx, item.id.Value(), "srv-9", 0);
    h.records->ConfirmSale(*tx, sale.sale.id.Value(), "sale-9");
    tx->Commit();
  }
  h.Complete(insert_key);
  h.Complete(OperationKey("sales", OperationType::kInsert, sale.sale.id.Value()));

  h.storage.DeleteInventoryItem("srv-9");
  pending = h.queue->ListPending();
  assert(pending.size() == 1);
  assert(pending[0].operation_key == InventoryKey(OperationType::kDelete, "srv-9"));
}

void TestPersistentQuantitySetMovesBehindUnsyncedSale() {
  Harness h;
  h.AddItem("Rice", 10, Identifier::Persistent("srv-1"));
  h.Complete(InventoryKey(OperationType::kInsert, "srv-1"));

  InventoryChanges rename;
  rename.name = "Basmati";
  h.storage.UpdateInventoryItem("srv-1", rename);

  SaleRequest request;
  request.user_id = "u1";
  auto sale       = h.storage.StoreSale(request, {SaleLineRequest{"srv-1", 2, std::nullopt, std::nullopt}});

  InventoryChanges restock;
  restock.quantity = 30;
  h.storage.UpdateInventoryItem("srv-1", restock);

  auto pending = h.queue->ListPending();
  assert(pending.size() == 2);
  assert(pending[0].operation_key == OperationKey("sales", OperationType::kInsert, sale.sale.id.Value()));
  assert(pending[1].operation_key == InventoryKey(OperationType::kUpdate, "srv-1"));

  auto update = h.Payload(pending[1].operation_key).inventory_update();
  assert(update.quantity_set());
  assert(update.item().quantity() == 30);
  assert(update.item().name() == "Basmati");
}

void TestDeletingUnsyncedRecordCancelsInsert() {
  Harness h;
  auto    item = h.AddItem("Rice", 10);
  h.storage.DeleteInventoryItem(item.id.Value());

  assert(h.queue->ListPending().empty());
  assert(h.storage.GetInventory(RecordScope{"u1", "", Role::kIndividual}).empty());
  assert(Throws<tally::util::NotFound>([&] { h.storage.DeleteInventoryItem(item.id.Value()); }));
}

void TestPersistentRecordsGetUpdateAndDeleteEntries() {
  Harness h;
  auto    item = h.AddItem("Rice", 10, Identifier::Persistent("srv-1"));
  h.Complete(InventoryKey(OperationType::kInsert, "srv-1"));

  InventoryChanges price;
  price.selling_price = 5.5;
  h.storage.UpdateInventoryItem(item.id.Value(), price);

  auto update = h.Payload(InventoryKey(OperationType::kUpdate, "srv-1"));
  assert(update.inventory_update().target().persistent() == "srv-1");
  assert(!update.inventory_update().quantity_set());
  assert(update.inventory_update().item().selling_price() == 5.5);

  InventoryChanges restock;
  restock.quantity = 40;
  h.storage.UpdateInventoryItem("srv-1", restock);
  assert(h.Payload(InventoryKey(OperationType::kUpdate, "srv-1")).inventory_update().quantity_set());

  h.storage.DeleteInventoryItem("srv-1");
  assert(!h.queue->Get(InventoryKey(OperationType::kUpdate, "srv-1")).has_value());

  auto pending = h.queue->ListPending();
  assert(pending.size() == 1);
  assert(pending[0].operation_key == InventoryKey(OperationType::kDelete, "srv-1"));
  assert(h.Payload(pending[0].operation_key).inventory_delete().target().persistent() == "srv-1");
}

void TestSaleIsQueuedOnceWithItsItems() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10);
  auto    salt = h.AddItem("Salt", 3);

  SaleRequest request;
  request.user_id = "u1";
  request.id      = Identifier::MintTemporary();

  auto outcome = h.storage.StoreSale(request, {SaleLineRequest{rice.id.Value(), 2, std::nullopt, std::nullopt},
                                               SaleLineRequest{salt.id.Value(), 1, std::nullopt, std::nullopt}});
  const auto key = OperationKey("sales", OperationType::kInsert, outcome.sale.id.Value());

  auto payload = h.Payload(key);
  assert(payload.sale_insert().items_size() == 2);
  assert(payload.sale_insert().sale().total_amount() == 12.0);

  auto replay = h.storage.StoreSale(request, {SaleLineRequest{rice.id.Value(), 2, std::nullopt, std::nullopt}});
  assert(replay.duplicate);
  assert(h.queue->ListPending().size() == 3);

  assert(Throws<tally::util::InsufficientStock>(
      [&] { h.storage.StoreSale(SaleRequest{std::nullopt, "u1"}, {SaleLineRequest{salt.id.Value(), 5, std::nullopt, std::nullopt}}); }));
  assert(h.queue->ListPending().size() == 3);
  assert(h.storage.GetSales(RecordScope{"u1", "", Role::kIndividual}).size() == 1);

  h.storage.ValidateStockAvailability({{rice.id.Value(), 8}});
  assert(Throws<tally::util::InsufficientStock>([&] { h.storage.ValidateStockAvailability({{rice.id.Value(), 9}}); }));
}

void TestExpenseQueueRules() {
  Harness h;

  ExpenseRecord expense;
  expense.user_id = "u1";
  expense.title   = "Fuel";
  expense.amount  = 30;
  auto stored     = h.storage.StoreExpense(expense);

  tally::records::ExpenseChanges changes;
  changes.amount = 35;
  h.storage.UpdateExpense(stored.id.Value(), changes);

  auto pending = h.queue->ListPending();
  assert(pending.size() == 1);
  assert(h.Payload(pending[0].operation_key).expense_insert().expense().amount() == 35);

  h.storage.DeleteExpense(stored.id.Value());
  assert(h.queue->ListPending().empty());
  assert(h.storage.GetExpenses(RecordScope{"u1", "", Role::kIndividual}).empty());
}

void TestProfileUsesOneUpdateKey() {
  Harness h;

  ProfileRecord profile;
  profile.user_id  = "u1";
  profile.role     = Role::kOwner;
  profile.store_id = "store-1";
  h.storage.StoreUserProfile(profile);

  profile.business_name = "Corner Shop";
  h.storage.StoreUserProfile(profile);

  auto pending = h.queue->ListPending();
  assert(pending.size() == 1);
  assert(pending[0].operation_key == "user_profiles:UPDATE:u1");
  assert(h.Payload(pending[0].operation_key).profile_upsert().profile().business_name() == "Corner Shop");

  auto stored = h.storage.GetUserProfile("u1");
  assert(stored.has_value());
  assert(stored->role == Role::kOwner);
}

void TestDashboardCacheExpiry() {
  Harness h;
  h.storage.StoreDashboardCache("dashboard:u1", R"({"sales":3})");
  assert(h.storage.GetDashboardCache("dashboard:u1") == std::optional<std::string>(R"({"sales":3})"));
  assert(!h.storage.GetDashboardCache("dashboard:u2").has_value());

  h.storage.StoreDashboardCache("dashboard:short", "{}", milliseconds(1));
  std::this_thread::sleep_for(milliseconds(5));
  assert(!h.storage.GetDashboardCache("dashboard:short").has_value());
  assert(h.storage.GetStorageStats().cached_entries == 1);

  h.storage.StoreDashboardCache("dashboard:a", "{}", milliseconds(1));
  h.storage.StoreDashboardCache("dashboard:b", "{}", milliseconds(1));
  std::this_thread::sleep_for(milliseconds(5));
  assert(h.storage.ClearExpiredDashboardCache() == 2);
  assert(h.storage.ClearExpiredDashboardCache() == 0);

  assert(Throws<tally::util::InvalidArgument>([&] { h.storage.StoreDashboardCache("k", "{}", milliseconds(0)); }));
}

void TestStatsAndClearing() {
  Harness h;
  auto    rice = h.AddItem("Rice", 10);
  SaleRequest request;
  request.user_id = "u1";
  h.storage.StoreSale(request, {SaleLineRequest{rice.id.Value(), 1, std::nullopt, std::nullopt}});
  h.storage.StoreDashboardCache("dashboard:u1", "{}");
  h.storage.SetSecure("user_session", "s");
  h.storage.SetSecure("device_id", "d");

  auto stats = h.storage.GetStorageStats();
  assert(stats.table_rows.at("inventory") == 1);
  assert(stats.table_rows.at("sales") == 1);
  assert(stats.table_rows.at("sale_items") == 1);
  assert(stats.table_rows.at("sync_queue") == 2);
  assert(stats.pending_sync_operations == 2);
  assert(stats.cached_entries == 1);

  h.storage.ClearAllAppData();
  stats = h.storage.GetStorageStats();
  for (const auto& [table, rows] : stats.table_rows) assert(rows == 0);
  assert(h.storage.GetSecure("user_session").has_value());

  h.storage.ClearAllData();
  assert(!h.storage.GetSecure("user_session").has_value());
  assert(h.storage.GetSecure("device_id").has_value());
}

} // namespace

int main() {
  TestInitIsIdempotentAndLazy();
  TestSecureStorage();
  TestEditsCollapseIntoPendingInsert();
  TestSaleDecrementIsNotCarriedIntoPendingInsert();
  TestQuantitySetAfterUnsyncedSaleQueuesBehindIt();
  TestPersistentQuantitySetMovesBehindUnsyncedSale();
  TestDeletingUnsyncedRecordCancelsInsert();
  TestPersistentRecordsGetUpdateAndDeleteEntries();
  TestSaleIsQueuedOnceWithItsItems();
  TestExpenseQueueRules();
  TestProfileUsesOneUpdateKey();
  TestDashboardCacheExpiry();
  TestStatsAndClearing();

  std::cout << "tally_unit_storage_facade: pass\n";
  return 0;
}
