#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/expense_record.hpp"
#include "internal/db/model/inventory_record.hpp"
#include "internal/db/model/profile_record.hpp"
#include "internal/db/model/sale_item_record.hpp"
#include "internal/db/model/sale_record.hpp"
#include "internal/db/model/sync_queue_record.hpp"

namespace tally::db {

/*
  Local store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its own writes
  - A record write and the sync queue entry describing it commit
    together or not at all

  Update* calls take the id the row is currently stored under; the
  record's own id may differ, which re-keys the row (temporary id ->
  persistent id). Re-keying a sale carries its line items along.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Creates or migrates the schema. Safe to call more than once.
  virtual void Bootstrap() = 0;

  // ---------------------------------------------------------------------
  // Inventory
  // ---------------------------------------------------------------------

  virtual Result InsertInventory(Transaction&, const model::InventoryRecord&) = 0;

  virtual std::optional<model::InventoryRecord> GetInventory(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::InventoryRecord> FindInventoryByTempId(Transaction&, const std::string& temp_id) = 0;

  virtual std::vector<model::InventoryRecord> ListInventory(Transaction&, const RecordFilter&) = 0;

  virtual Result UpdateInventory(Transaction&, const std::string& current_id, const model::InventoryRecord&) = 0;

  virtual Result DeleteInventory(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Sales
  // ---------------------------------------------------------------------

  virtual Result InsertSale(Transaction&, const model::SaleRecord&) = 0;

  virtual std::optional<model::SaleRecord> GetSale(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SaleRecord> FindSaleByTempId(Transaction&, const std::string& temp_id) = 0;

  virtual std::vector<model::SaleRecord> ListSales(Transaction&, const RecordFilter&) = 0;

  virtual Result UpdateSale(Transaction&, const std::string& current_id, const model::SaleRecord&) = 0;

  // ---------------------------------------------------------------------
  // Sale line items
  // ---------------------------------------------------------------------

  virtual Result InsertSaleItem(Transaction&, const model::SaleItemRecord&) = 0;

  virtual std::optional<model::SaleItemRecord> GetSaleItem(Transaction&, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::SaleItemRecord> ListSaleItems(Transaction&, const std::string& sale_id) = 0;

  // Items whose inventory reference text equals inventory_ref.
  virtual std::vector<model::SaleItemRecord> ListSaleItemsByInventory(Transaction&, const std::string& inventory_ref) = 0;

  virtual Result UpdateSaleItem(Transaction&, const model::SaleItemRecord&) = 0;

  // ---------------------------------------------------------------------
  // Expenses
  // ---------------------------------------------------------------------

  virtual Result InsertExpense(Transaction&, const model::ExpenseRecord&) = 0;

  virtual std::optional<model::ExpenseRecord> GetExpense(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ExpenseRecord> FindExpenseByTempId(Transaction&, const std::string& temp_id) = 0;

  virtual std::vector<model::ExpenseRecord> ListExpenses(Transaction&, const RecordFilter&) = 0;

  virtual Result UpdateExpense(Transaction&, const std::string& current_id, const model::ExpenseRecord&) = 0;

  virtual Result DeleteExpense(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // User profiles
  // ---------------------------------------------------------------------

  // Insert, or replace the row with the same user_id (its id is kept).
  virtual Result UpsertProfile(Transaction&, const model::ProfileRecord&) = 0;

  virtual std::optional<model::ProfileRecord> GetProfileByUserId(Transaction&, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Sync queue
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when operation_key is taken.
  virtual Result InsertSyncOperation(Transaction&, model::SyncQueueRecord& record) = 0;

  virtual std::optional<model::SyncQueueRecord> GetSyncOperation(Transaction&, int64_t id) = 0;

  virtual std::optional<model::SyncQueueRecord> GetSyncOperationByKey(Transaction&, const std::string& operation_key) = 0;

  // Ordered by (created_at_ms, id).
  virtual std::vector<model::SyncQueueRecord> ListSyncOperations(Transaction&, const SyncQueueFilter&) = 0;

  virtual Result UpdateSyncOperation(Transaction&, const model::SyncQueueRecord&) = 0;

  virtual Result DeleteSyncOperation(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Dashboard cache
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheRecord&) = 0;

  virtual std::optional<model::CacheRecord> GetCacheEntry(Transaction&, const std::string& key) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;

  // Removes entries with expires_at_ms <= now_ms; returns how many.
  virtual uint64_t DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  virtual uint64_t CountRows(Transaction&, Table) = 0;

  virtual Result ClearTable(Transaction&, Table) = 0;
};

} // namespace tally::db
