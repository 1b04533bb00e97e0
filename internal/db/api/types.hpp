#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tally::db {

enum class Table {
  kInventory,
  kSales,
  kSaleItems,
  kExpenses,
  kUserProfiles,
  kSyncQueue,
  kCacheEntries,
};

inline constexpr Table kAllTables[] = {Table::kInventory,    Table::kSales,     Table::kSaleItems,    Table::kExpenses,
                                       Table::kUserProfiles, Table::kSyncQueue, Table::kCacheEntries};

// Local table name. Also the sync queue's table_name for routed entities.
inline const char* TableName(Table table) {
  switch (table) {
    case Table::kInventory: return "inventory";
    case Table::kSales: return "sales";
    case Table::kSaleItems: return "sale_items";
    case Table::kExpenses: return "expenses";
    case Table::kUserProfiles: return "user_profiles";
    case Table::kSyncQueue: return "sync_queue";
    case Table::kCacheEntries: return "cache_entries";
  }
  return "";
}

// Unset fields do not filter.
struct RecordFilter {
  std::optional<std::string> user_id;
  std::optional<std::string> store_id;
  std::optional<bool>        synced;
};

struct SyncQueueFilter {
  // synced = 0 only
  bool pending_only = true;
  // attempts < max_attempts only
  bool retryable_only = false;
  // matches a single table_name
  std::optional<std::string> table_name;
  std::optional<uint64_t>    limit;
};

} // namespace tally::db
