#include "storage_facade.hpp"

#include "internal/db/api/types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/payload_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tally::storage {

using db::Table;
using db::TableName;
using db::model::ExpenseRecord;
using db::model::InventoryRecord;
using db::model::OperationType;
using db::model::ProfileRecord;
using observability::IntField;
using observability::StringField;
using sync::OperationKey;

namespace {

const std::string kInventory = TableName(Table::kInventory);
const std::string kSales     = TableName(Table::kSales);
const std::string kExpenses  = TableName(Table::kExpenses);
const std::string kProfiles  = TableName(Table::kUserProfiles);

} // namespace

StorageFacade::StorageFacade(std::shared_ptr<db::Repository> store, std::shared_ptr<records::RecordRepository> records,
                             std::shared_ptr<sync::SyncQueue> queue, std::shared_ptr<credentials::CredentialStore> credentials)
    : store_(std::move(store)), records_(std::move(records)), queue_(std::move(queue)), credentials_(std::move(credentials)) {
}

void StorageFacade::Init() {
  std::lock_guard lock(init_mutex_);
  if (initialized_) return;

  store_->Bootstrap();
  credentials_->Open();

  initialized_ = true;
  TALLY_LOG_INFO("storage initialized");
}

bool StorageFacade::IsInitialized() const {
  std::lock_guard lock(init_mutex_);
  return initialized_;
}

void StorageFacade::EnsureInitialized() {
  Init();
}

// ------------------------------------------------------------------
// Secure values
// ------------------------------------------------------------------

void StorageFacade::SetSecure(const std::string& key, const std::string& value) {
  EnsureInitialized();
  credentials_->Set(key, value);
}

std::optional<std::string> StorageFacade::GetSecure(const std::string& key) {
  EnsureInitialized();
  return credentials_->Get(key);
}

void StorageFacade::RemoveSecure(const std::string& key) {
  EnsureInitialized();
  credentials_->Remove(key);
}

void StorageFacade::ClearSecureStorage() {
  EnsureInitialized();
  for (const char* key : kAuthCredentialKeys) credentials_->Remove(key);
  TALLY_LOG_INFO("secure storage cleared");
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

InventoryRecord StorageFacade::StoreInventoryItem(InventoryRecord item) {
  EnsureInitialized();

  auto tx     = store_->Begin();
  auto stored = records_->AddInventoryItem(*tx, std::move(item));
  queue_->Enqueue(*tx, OperationKey(kInventory, OperationType::kInsert, stored.id.Value()), kInventory, stored.id.Value(),
                  OperationType::kInsert, sync::InventoryInsertPayload(stored));
  tx->Commit();
  return stored;
}

std::vector<InventoryRecord> StorageFacade::GetInventory(const records::RecordScope& scope) {
  EnsureInitialized();
  return records_->ListInventory(scope);
}

InventoryRecord StorageFacade::UpdateInventoryItem(const std::string& id, const records::InventoryChanges& changes) {
  EnsureInitialized();

  auto tx  = store_->Begin();
  auto row = records_->UpdateInventoryItem(*tx, id, changes);

  // Sale decrements are replayed by sale sync, so a payload carries only a
  // user-set quantity. A quantity set after a sale still waiting to sync
  // has to replay behind that sale.
  const bool after_sale = changes.quantity.has_value() && records_->HasUnsyncedSaleItems(*tx, row);

  auto pending = [&](const std::string& key) -> std::optional<db::model::SyncQueueRecord> {
    auto entry = queue_->Get(*tx, key);
    if (!entry || entry->synced) return std::nullopt;
    return entry;
  };
  auto replayed = [&](const std::string& key) -> std::optional<int64_t> {
    auto entry = pending(key);
    if (!entry) return std::nullopt;
    return sync::ReplayedQuantity(*entry);
  };

  const auto update_key = OperationKey(kInventory, OperationType::kUpdate, row.id.Value());

  if (row.id.IsTemporary()) {
    const auto insert_key = OperationKey(kInventory, OperationType::kInsert, row.id.Value());

    auto insert = row;
    if (!changes.quantity || after_sale) {
      if (auto quantity = replayed(insert_key)) insert.quantity = *quantity;
    }
    queue_->Enqueue(*tx, insert_key, kInventory, row.id.Value(), OperationType::kInsert, sync::InventoryInsertPayload(insert));

    // the insert's target is not on the remote yet; the quantity follows
    // as an update resolved through temp_id
    if (after_sale) {
      queue_->Requeue(*tx, update_key, kInventory, row.id.Value(), OperationType::kUpdate, sync::InventoryUpdatePayload(row, true));
    } else if (pending(update_key)) {
      auto update = row;
      if (!changes.quantity) update.quantity = replayed(update_key).value_or(row.quantity);
      queue_->Enqueue(*tx, update_key, kInventory, row.id.Value(), OperationType::kUpdate, sync::InventoryUpdatePayload(update, true));
    }
  } else {
    auto update = row;
    bool quantity_set = changes.quantity.has_value();
    if (!quantity_set) {
      if (auto quantity = replayed(update_key)) {
        update.quantity = *quantity;
        quantity_set    = true;
      }
    }

    auto payload = sync::InventoryUpdatePayload(update, quantity_set);
    if (after_sale) {
      queue_->Requeue(*tx, update_key, kInventory, row.id.Value(), OperationType::kUpdate, std::move(payload));
    } else {
      queue_->Enqueue(*tx, update_key, kInventory, row.id.Value(), OperationType::kUpdate, std::move(payload));
    }
  }

  tx->Commit();
  return row;
}

void StorageFacade::DeleteInventoryItem(const std::string& id) {
  EnsureInitialized();

  auto tx  = store_->Begin();
  auto row = records_->DeleteInventoryItem(*tx, id);

  queue_->CancelPending(*tx, OperationKey(kInventory, OperationType::kUpdate, row.id.Value()));
  if (!row.temp_id.empty() && row.temp_id != row.id.Value()) {
    queue_->CancelPending(*tx, OperationKey(kInventory, OperationType::kUpdate, row.temp_id));
  }

  if (row.id.IsTemporary()) {
    queue_->CancelPending(*tx, OperationKey(kInventory, OperationType::kInsert, row.id.Value()));
  } else {
    queue_->Enqueue(*tx, OperationKey(kInventory, OperationType::kDelete, row.id.Value()), kInventory, row.id.Value(),
                    OperationType::kDelete, sync::InventoryDeletePayload(row.id));
  }

  tx->Commit();
  TALLY_LOG_INFO("inventory item deleted", {StringField("record_id", row.id.Value())});
}

std::optional<InventoryRecord> StorageFacade::FindInventoryItemByTempId(const std::string& temp_id) {
  EnsureInitialized();
  return records_->FindInventoryItemByTempId(temp_id);
}

void StorageFacade::ValidateStockAvailability(const std::vector<records::StockRequest>& requests) {
  EnsureInitialized();
  records_->ValidateStockAvailability(requests);
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

records::SaleOutcome StorageFacade::StoreSale(const records::SaleRequest& request, const std::vector<records::SaleLineRequest>& lines) {
  EnsureInitialized();

  return records_->ProcessSale(request, lines, [this](db::Transaction& tx, const records::SaleOutcome& outcome) {
    const auto& id = outcome.sale.id.Value();
    queue_->Enqueue(tx, OperationKey(kSales, OperationType::kInsert, id), kSales, id, OperationType::kInsert,
                    sync::SaleInsertPayload(outcome.sale, outcome.items));
  });
}

std::vector<db::model::SaleRecord> StorageFacade::GetSales(const records::RecordScope& scope) {
  EnsureInitialized();
  return records_->ListSales(scope);
}

// ------------------------------------------------------------------
// Expenses
// ------------------------------------------------------------------

ExpenseRecord StorageFacade::StoreExpense(ExpenseRecord expense) {
  EnsureInitialized();

  auto tx     = store_->Begin();
  auto stored = records_->AddExpense(*tx, std::move(expense));
  queue_->Enqueue(*tx, OperationKey(kExpenses, OperationType::kInsert, stored.id.Value()), kExpenses, stored.id.Value(),
                  OperationType::kInsert, sync::ExpenseInsertPayload(stored));
  tx->Commit();
  return stored;
}

std::vector<ExpenseRecord> StorageFacade::GetExpenses(const records::RecordScope& scope) {
  EnsureInitialized();
  return records_->ListExpenses(scope);
}

ExpenseRecord StorageFacade::UpdateExpense(const std::string& id, const records::ExpenseChanges& changes) {
  EnsureInitialized();

  auto tx  = store_->Begin();
  auto row = records_->UpdateExpense(*tx, id, changes);

  if (row.id.IsTemporary()) {
    queue_->Enqueue(*tx, OperationKey(kExpenses, OperationType::kInsert, row.id.Value()), kExpenses, row.id.Value(),
                    OperationType::kInsert, sync::ExpenseInsertPayload(row));
  } else {
    queue_->Enqueue(*tx, OperationKey(kExpenses, OperationType::kUpdate, row.id.Value()), kExpenses, row.id.Value(),
                    OperationType::kUpdate, sync::ExpenseUpdatePayload(row));
  }

  tx->Commit();
  return row;
}

void StorageFacade::DeleteExpense(const std::string& id) {
  EnsureInitialized();

  auto tx  = store_->Begin();
  auto row = records_->DeleteExpense(*tx, id);

  if (row.id.IsTemporary()) {
    queue_->CancelPending(*tx, OperationKey(kExpenses, OperationType::kInsert, row.id.Value()));
  } else {
    queue_->CancelPending(*tx, OperationKey(kExpenses, OperationType::kUpdate, row.id.Value()));
    queue_->Enqueue(*tx, OperationKey(kExpenses, OperationType::kDelete, row.id.Value()), kExpenses, row.id.Value(),
                    OperationType::kDelete, sync::ExpenseDeletePayload(row.id));
  }

  tx->Commit();
  TALLY_LOG_INFO("expense deleted", {StringField("record_id", row.id.Value())});
}

// ------------------------------------------------------------------
// User profile
// ------------------------------------------------------------------

ProfileRecord StorageFacade::StoreUserProfile(ProfileRecord profile) {
  EnsureInitialized();

  auto tx     = store_->Begin();
  auto stored = records_->StoreUserProfile(*tx, std::move(profile));
  queue_->Enqueue(*tx, OperationKey(kProfiles, OperationType::kUpdate, stored.user_id), kProfiles, stored.user_id,
                  OperationType::kUpdate, sync::ProfileUpsertPayload(stored));
  tx->Commit();
  return stored;
}

std::optional<ProfileRecord> StorageFacade::GetUserProfile(const std::string& user_id) {
  EnsureInitialized();
  return records_->GetUserProfile(user_id);
}

// ------------------------------------------------------------------
// Dashboard cache
// ------------------------------------------------------------------

void StorageFacade::StoreDashboardCache(const std::string& key, const std::string& json, std::chrono::milliseconds ttl) {
  EnsureInitialized();
  if (ttl.count() <= 0) throw util::InvalidArgument("dashboard cache ttl must be positive");

  const auto          now = util::NowMs();
  db::model::CacheRecord entry;
  entry.key           = key;
  entry.value         = json;
  entry.created_at_ms = now;
  entry.expires_at_ms = now + static_cast<uint64_t>(ttl.count());

  auto tx = store_->Begin();
  util::ThrowIfDbError(store_->UpsertCacheEntry(*tx, entry), "store dashboard cache " + key);
  tx->Commit();
}

std::optional<std::string> StorageFacade::GetDashboardCache(const std::string& key) {
  EnsureInitialized();

  auto tx    = store_->Begin();
  auto entry = store_->GetCacheEntry(*tx, key);
  if (!entry) return std::nullopt;

  if (entry->expires_at_ms <= util::NowMs()) {
    util::ThrowIfDbError(store_->DeleteCacheEntry(*tx, key), "expire dashboard cache " + key);
    tx->Commit();
    return std::nullopt;
  }
  return entry->value;
}

uint64_t StorageFacade::ClearExpiredDashboardCache() {
  EnsureInitialized();

  auto tx      = store_->Begin();
  auto removed = store_->DeleteExpiredCacheEntries(*tx, util::NowMs());
  tx->Commit();

  if (removed > 0) TALLY_LOG_DEBUG("expired dashboard cache removed", {IntField("entries", static_cast<int64_t>(removed))});
  return removed;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

StorageStats StorageFacade::GetStorageStats() {
  EnsureInitialized();

  StorageStats stats;
  {
    auto tx = store_->Begin();
    for (auto table : db::kAllTables) stats.table_rows[TableName(table)] = store_->CountRows(*tx, table);
  }
  stats.cached_entries          = stats.table_rows[TableName(Table::kCacheEntries)];
  stats.pending_sync_operations = queue_->Counts().pending;
  return stats;
}

void StorageFacade::ClearAllAppData() {
  EnsureInitialized();

  auto tx = store_->Begin();
  // children first
  for (auto table : {Table::kSaleItems, Table::kSales, Table::kInventory, Table::kExpenses, Table::kUserProfiles, Table::kSyncQueue,
                     Table::kCacheEntries}) {
    util::ThrowIfDbError(store_->ClearTable(*tx, table), std::string("clear ") + TableName(table));
  }
  tx->Commit();
  TALLY_LOG_WARN("all local app data cleared");
}

void StorageFacade::ClearAllData() {
  ClearAllAppData();
  ClearSecureStorage();
}

} // namespace tally::storage
