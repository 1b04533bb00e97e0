#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tally::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  void                         Bootstrap() override;

  Result InsertInventory(Transaction&, const model::InventoryRecord&) override;
  std::optional<model::InventoryRecord> GetInventory(Transaction&, const std::string&) override;
  std::optional<model::InventoryRecord> FindInventoryByTempId(Transaction&, const std::string&) override;
  std::vector<model::InventoryRecord>   ListInventory(Transaction&, const RecordFilter&) override;
  Result UpdateInventory(Transaction&, const std::string& current_id, const model::InventoryRecord&) override;
  Result DeleteInventory(Transaction&, const std::string&) override;

  Result InsertSale(Transaction&, const model::SaleRecord&) override;
  std::optional<model::SaleRecord> GetSale(Transaction&, const std::string&) override;
  std::optional<model::SaleRecord> FindSaleByTempId(Transaction&, const std::string&) override;
  std::vector<model::SaleRecord>   ListSales(Transaction&, const RecordFilter&) override;
  Result UpdateSale(Transaction&, const std::string& current_id, const model::SaleRecord&) override;

  Result InsertSaleItem(Transaction&, const model::SaleItemRecord&) override;
  std::optional<model::SaleItemRecord> GetSaleItem(Transaction&, const std::string&) override;
  std::vector<model::SaleItemRecord>   ListSaleItems(Transaction&, const std::string& sale_id) override;
  std::vector<model::SaleItemRecord>   ListSaleItemsByInventory(Transaction&, const std::string& inventory_ref) override;
  Result UpdateSaleItem(Transaction&, const model::SaleItemRecord&) override;

  Result InsertExpense(Transaction&, const model::ExpenseRecord&) override;
  std::optional<model::ExpenseRecord> GetExpense(Transaction&, const std::string&) override;
  std::optional<model::ExpenseRecord> FindExpenseByTempId(Transaction&, const std::string&) override;
  std::vector<model::ExpenseRecord>   ListExpenses(Transaction&, const RecordFilter&) override;
  Result UpdateExpense(Transaction&, const std::string& current_id, const model::ExpenseRecord&) override;
  Result DeleteExpense(Transaction&, const std::string&) override;

  Result UpsertProfile(Transaction&, const model::ProfileRecord&) override;
  std::optional<model::ProfileRecord> GetProfileByUserId(Transaction&, const std::string&) override;

  Result InsertSyncOperation(Transaction&, model::SyncQueueRecord&) override;
  std::optional<model::SyncQueueRecord> GetSyncOperation(Transaction&, int64_t) override;
  std::optional<model::SyncQueueRecord> GetSyncOperationByKey(Transaction&, const std::string&) override;
  std::vector<model::SyncQueueRecord>   ListSyncOperations(Transaction&, const SyncQueueFilter&) override;
  Result UpdateSyncOperation(Transaction&, const model::SyncQueueRecord&) override;
  Result DeleteSyncOperation(Transaction&, int64_t) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheRecord&) override;
  std::optional<model::CacheRecord> GetCacheEntry(Transaction&, const std::string&) override;
  Result   DeleteCacheEntry(Transaction&, const std::string&) override;
  uint64_t DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms) override;

  uint64_t CountRows(Transaction&, Table) override;
  Result   ClearTable(Transaction&, Table) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace tally::db::sqlite
