#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace tally::db::memory {

namespace {

template <typename Record>
bool Matches(const Record& r, const RecordFilter& filter) {
  if (filter.user_id && r.user_id != *filter.user_id) return false;
  if (filter.store_id && r.store_id != *filter.store_id) return false;
  if (filter.synced && r.synced != *filter.synced) return false;
  return true;
}

// Same ordering as the SQLite backend: newest first, then id.
template <typename Record>
std::vector<Record> FilterSorted(const std::map<std::string, Record>& rows, const RecordFilter& filter) {
  std::vector<Record> out;
  for (const auto& [_, r] : rows) {
    if (Matches(r, filter)) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const Record& a, const Record& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id.Value() < b.id.Value();
  });
  return out;
}

template <typename Record>
std::optional<Record> FindByTempId(const std::map<std::string, Record>& rows, const std::string& temp_id) {
  if (temp_id.empty()) return std::nullopt;
  for (const auto& [_, r] : rows) {
    if (r.temp_id == temp_id) return r;
  }
  return std::nullopt;
}

template <typename Record>
bool TempIdTaken(const std::map<std::string, Record>& rows, const Record& r, const std::string& ignore_id) {
  if (r.temp_id.empty()) return false;
  for (const auto& [id, other] : rows) {
    if (id != ignore_id && other.temp_id == r.temp_id) return true;
  }
  return false;
}

// Replaces rows[current_id] with r, moving it under r's id if it changed.
template <typename Record>
Result Rekey(std::map<std::string, Record>& rows, const std::string& current_id, const Record& r) {
  auto it = rows.find(current_id);
  if (it == rows.end()) return Result::Err(ErrorCode::NotFound, current_id);

  const auto& new_id = r.id.Value();
  if (new_id != current_id && rows.contains(new_id)) return Result::Err(ErrorCode::AlreadyExists, new_id);
  if (TempIdTaken(rows, r, current_id)) return Result::Err(ErrorCode::AlreadyExists, "temp_id " + r.temp_id);

  rows.erase(it);
  rows[new_id] = r;
  return Result::Ok();
}

template <typename Record>
Result InsertUnique(std::map<std::string, Record>& rows, const Record& r) {
  const auto& id = r.id.Value();
  if (rows.contains(id)) return Result::Err(ErrorCode::AlreadyExists, id);
  if (TempIdTaken(rows, r, id)) return Result::Err(ErrorCode::AlreadyExists, "temp_id " + r.temp_id);
  rows[id] = r;
  return Result::Ok();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

void MemoryRepository::Bootstrap() {
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

Result MemoryRepository::InsertInventory(Transaction& t, const model::InventoryRecord& r) {
  return InsertUnique(TX(t).Mutable().inventory, r);
}

std::optional<model::InventoryRecord> MemoryRepository::GetInventory(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.inventory.find(id);
  if (it == s.inventory.end()) return std::nullopt;
  return it->second;
}

std::optional<model::InventoryRecord> MemoryRepository::FindInventoryByTempId(Transaction& t, const std::string& temp_id) {
  return FindByTempId(TX(t).View().inventory, temp_id);
}

std::vector<model::InventoryRecord> MemoryRepository::ListInventory(Transaction& t, const RecordFilter& filter) {
  return FilterSorted(TX(t).View().inventory, filter);
}

Result MemoryRepository::UpdateInventory(Transaction& t, const std::string& current_id, const model::InventoryRecord& r) {
  return Rekey(TX(t).Mutable().inventory, current_id, r);
}

Result MemoryRepository::DeleteInventory(Transaction& t, const std::string& id) {
  TX(t).Mutable().inventory.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

Result MemoryRepository::InsertSale(Transaction& t, const model::SaleRecord& r) {
  return InsertUnique(TX(t).Mutable().sales, r);
}

std::optional<model::SaleRecord> MemoryRepository::GetSale(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sales.find(id);
  if (it == s.sales.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SaleRecord> MemoryRepository::FindSaleByTempId(Transaction& t, const std::string& temp_id) {
  return FindByTempId(TX(t).View().sales, temp_id);
}

std::vector<model::SaleRecord> MemoryRepository::ListSales(Transaction& t, const RecordFilter& filter) {
  return FilterSorted(TX(t).View().sales, filter);
}

Result MemoryRepository::UpdateSale(Transaction& t, const std::string& current_id, const model::SaleRecord& r) {
  auto& s      = TX(t).Mutable();
  auto  result = Rekey(s.sales, current_id, r);
  if (!result) return result;

  // mirrors ON UPDATE CASCADE on sale_items.sale_id
  if (r.id.Value() != current_id) {
    for (auto& [_, item] : s.sale_items) {
      if (item.sale_id == current_id) item.sale_id = r.id.Value();
    }
  }
  return result;
}

// ------------------------------------------------------------------
// Sale line items
// ------------------------------------------------------------------

Result MemoryRepository::InsertSaleItem(Transaction& t, const model::SaleItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sales.contains(r.sale_id)) return Result::Err(ErrorCode::ConstraintViolation, "sale " + r.sale_id + " does not exist");
  if (s.sale_items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.sale_items[r.id] = r;
  return Result::Ok();
}

std::optional<model::SaleItemRecord> MemoryRepository::GetSaleItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sale_items.find(id);
  if (it == s.sale_items.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SaleItemRecord> MemoryRepository::ListSaleItems(Transaction& t, const std::string& sale_id) {
  std::vector<model::SaleItemRecord> out;
  for (const auto& [_, item] : TX(t).View().sale_items) {
    if (item.sale_id == sale_id) out.push_back(item);
  }
  return out;
}

std::vector<model::SaleItemRecord> MemoryRepository::ListSaleItemsByInventory(Transaction& t, const std::string& inventory_ref) {
  std::vector<model::SaleItemRecord> out;
  for (const auto& [_, item] : TX(t).View().sale_items) {
    if (item.inventory_id.Value() == inventory_ref) out.push_back(item);
  }
  return out;
}

Result MemoryRepository::UpdateSaleItem(Transaction& t, const model::SaleItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sale_items.find(r.id);
  if (it == s.sale_items.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Expenses
// ------------------------------------------------------------------

Result MemoryRepository::InsertExpense(Transaction& t, const model::ExpenseRecord& r) {
  return InsertUnique(TX(t).Mutable().expenses, r);
}

std::optional<model::ExpenseRecord> MemoryRepository::GetExpense(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.expenses.find(id);
  if (it == s.expenses.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ExpenseRecord> MemoryRepository::FindExpenseByTempId(Transaction& t, const std::string& temp_id) {
  return FindByTempId(TX(t).View().expenses, temp_id);
}

std::vector<model::ExpenseRecord> MemoryRepository::ListExpenses(Transaction& t, const RecordFilter& filter) {
  return FilterSorted(TX(t).View().expenses, filter);
}

Result MemoryRepository::UpdateExpense(Transaction& t, const std::string& current_id, const model::ExpenseRecord& r) {
  return Rekey(TX(t).Mutable().expenses, current_id, r);
}

Result MemoryRepository::DeleteExpense(Transaction& t, const std::string& id) {
  TX(t).Mutable().expenses.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// User profiles
// ------------------------------------------------------------------

Result MemoryRepository::UpsertProfile(Transaction& t, const model::ProfileRecord& r) {
  auto& profiles = TX(t).Mutable().profiles;
  auto  it       = profiles.find(r.user_id);
  if (it == profiles.end()) {
    profiles[r.user_id] = r;
    return Result::Ok();
  }

  auto kept_id         = it->second.id;
  auto kept_created_at = it->second.created_at_ms;
  it->second           = r;
  it->second.id            = kept_id;
  it->second.created_at_ms = kept_created_at;
  return Result::Ok();
}

std::optional<model::ProfileRecord> MemoryRepository::GetProfileByUserId(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.profiles.find(user_id);
  if (it == s.profiles.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertSyncOperation(Transaction& t, model::SyncQueueRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.sync_queue) {
    if (existing.operation_key == r.operation_key) return Result::Err(ErrorCode::AlreadyExists, r.operation_key);
  }
  r.id               = s.next_sync_id++;
  s.sync_queue[r.id] = r;
  return Result::Ok();
}

std::optional<model::SyncQueueRecord> MemoryRepository::GetSyncOperation(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.sync_queue.find(id);
  if (it == s.sync_queue.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SyncQueueRecord> MemoryRepository::GetSyncOperationByKey(Transaction& t, const std::string& operation_key) {
  for (const auto& [_, r] : TX(t).View().sync_queue) {
    if (r.operation_key == operation_key) return r;
  }
  return std::nullopt;
}

std::vector<model::SyncQueueRecord> MemoryRepository::ListSyncOperations(Transaction& t, const SyncQueueFilter& filter) {
  std::vector<model::SyncQueueRecord> out;
  for (const auto& [_, r] : TX(t).View().sync_queue) {
    if (filter.pending_only && r.synced) continue;
    if (filter.retryable_only && r.attempts >= r.max_attempts) continue;
    if (filter.table_name && r.table_name != *filter.table_name) continue;
    out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::SyncQueueRecord& a, const model::SyncQueueRecord& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
  if (filter.limit && out.size() > *filter.limit) out.resize(*filter.limit);
  return out;
}

Result MemoryRepository::UpdateSyncOperation(Transaction& t, const model::SyncQueueRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sync_queue.find(r.id);
  if (it == s.sync_queue.end()) return Result::Err(ErrorCode::NotFound, "sync operation " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSyncOperation(Transaction& t, int64_t id) {
  TX(t).Mutable().sync_queue.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Dashboard cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheRecord& r) {
  TX(t).Mutable().cache[r.key] = r;
  return Result::Ok();
}

std::optional<model::CacheRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.cache.find(key);
  if (it == s.cache.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  TX(t).Mutable().cache.erase(key);
  return Result::Ok();
}

uint64_t MemoryRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms) {
  return static_cast<uint64_t>(std::erase_if(TX(t).Mutable().cache, [now_ms](const auto& entry) {
    return entry.second.expires_at_ms <= now_ms;
  }));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

uint64_t MemoryRepository::CountRows(Transaction& t, Table table) {
  const auto& s = TX(t).View();
  switch (table) {
    case Table::kInventory: return s.inventory.size();
    case Table::kSales: return s.sales.size();
    case Table::kSaleItems: return s.sale_items.size();
    case Table::kExpenses: return s.expenses.size();
    case Table::kUserProfiles: return s.profiles.size();
    case Table::kSyncQueue: return s.sync_queue.size();
    case Table::kCacheEntries: return s.cache.size();
  }
  return 0;
}

Result MemoryRepository::ClearTable(Transaction& t, Table table) {
  auto& s = TX(t).Mutable();
  switch (table) {
    case Table::kInventory: s.inventory.clear(); break;
    case Table::kSales:
      // mirrors ON DELETE CASCADE
      s.sales.clear();
      s.sale_items.clear();
      break;
    case Table::kSaleItems: s.sale_items.clear(); break;
    case Table::kExpenses: s.expenses.clear(); break;
    case Table::kUserProfiles: s.profiles.clear(); break;
    case Table::kSyncQueue: s.sync_queue.clear(); break;
    case Table::kCacheEntries: s.cache.clear(); break;
  }
  return Result::Ok();
}

} // namespace tally::db::memory
