#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/credentials/credential_store.hpp"
#include "internal/records/record_repository.hpp"
#include "internal/sync/sync_queue.hpp"

namespace tally::storage {

// Session material removed by ClearSecureStorage().
inline constexpr const char* kAuthCredentialKeys[] = {"user_session", "user_tokens", "cached_user_session"};

inline constexpr std::chrono::minutes kDefaultDashboardCacheTtl{60};

struct StorageStats {
  // local row count per table name
  std::map<std::string, uint64_t> table_rows;

  uint64_t pending_sync_operations = 0;
  uint64_t cached_entries          = 0;
};

/*
  Single entry point for application data.

  Sequences initialization of the local store and the credential store
  and pairs every record mutation with its sync queue entry in one local
  transaction.

  Queueing rules:
    - a record with a temporary id has at most one pending INSERT; edits
      collapse into it
    - deleting a never-synced record cancels that INSERT
    - persistent records get UPDATE / DELETE entries
*/
class StorageFacade {
 public:
  StorageFacade(std::shared_ptr<db::Repository> store, std::shared_ptr<records::RecordRepository> records,
                std::shared_ptr<sync::SyncQueue> queue, std::shared_ptr<credentials::CredentialStore> credentials);

  // Idempotent. Every other call initializes lazily.
  void Init();

  bool IsInitialized() const;

  // ---------------------------------------------------------------------
  // Secure values
  // ---------------------------------------------------------------------

  void                       SetSecure(const std::string& key, const std::string& value);
  std::optional<std::string> GetSecure(const std::string& key);
  void                       RemoveSecure(const std::string& key);
  void                       ClearSecureStorage();

  // ---------------------------------------------------------------------
  // Inventory
  // ---------------------------------------------------------------------

  db::model::InventoryRecord              StoreInventoryItem(db::model::InventoryRecord item);
  std::vector<db::model::InventoryRecord> GetInventory(const records::RecordScope& scope);
  db::model::InventoryRecord              UpdateInventoryItem(const std::string& id, const records::InventoryChanges& changes);
  void                                    DeleteInventoryItem(const std::string& id);

  std::optional<db::model::InventoryRecord> FindInventoryItemByTempId(const std::string& temp_id);

  void ValidateStockAvailability(const std::vector<records::StockRequest>& requests);

  // ---------------------------------------------------------------------
  // Sales
  // ---------------------------------------------------------------------

  records::SaleOutcome StoreSale(const records::SaleRequest& request, const std::vector<records::SaleLineRequest>& lines);

  std::vector<db::model::SaleRecord> GetSales(const records::RecordScope& scope);

  // ---------------------------------------------------------------------
  // Expenses
  // ---------------------------------------------------------------------

  db::model::ExpenseRecord              StoreExpense(db::model::ExpenseRecord expense);
  std::vector<db::model::ExpenseRecord> GetExpenses(const records::RecordScope& scope);
  db::model::ExpenseRecord              UpdateExpense(const std::string& id, const records::ExpenseChanges& changes);
  void                                  DeleteExpense(const std::string& id);

  // ---------------------------------------------------------------------
  // User profile
  // ---------------------------------------------------------------------

  db::model::ProfileRecord                StoreUserProfile(db::model::ProfileRecord profile);
  std::optional<db::model::ProfileRecord> GetUserProfile(const std::string& user_id);

  // ---------------------------------------------------------------------
  // Dashboard cache
  // ---------------------------------------------------------------------

  void StoreDashboardCache(const std::string& key, const std::string& json,
                           std::chrono::milliseconds ttl = kDefaultDashboardCacheTtl);

  // Expired entries are removed on read.
  std::optional<std::string> GetDashboardCache(const std::string& key);

  uint64_t ClearExpiredDashboardCache();

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  StorageStats GetStorageStats();

  // Local tables only.
  void ClearAllAppData();

  // Local tables and credentials.
  void ClearAllData();

 private:
  void EnsureInitialized();

  std::shared_ptr<db::Repository>               store_;
  std::shared_ptr<records::RecordRepository>    records_;
  std::shared_ptr<sync::SyncQueue>              queue_;
  std::shared_ptr<credentials::CredentialStore> credentials_;

  mutable std::mutex init_mutex_;
  bool               initialized_ = false;
};

} // namespace tally::storage
