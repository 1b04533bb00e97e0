#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tally::records {

// Only the fields that are set are applied.
struct InventoryChanges {
  std::optional<std::string> name;
  std::optional<std::string> sku;
  std::optional<std::string> category;
  std::optional<std::string> store_id;
  std::optional<int64_t>     quantity;
  std::optional<double>      cost_price;
  std::optional<double>      selling_price;
  std::optional<int64_t>     minimum_stock_level;
  std::optional<bool>        is_active;
};

struct ExpenseChanges {
  std::optional<std::string> title;
  std::optional<std::string> category;
  std::optional<std::string> description;
  std::optional<double>      amount;
  std::optional<uint64_t>    expense_date_ms;
  std::optional<std::string> vendor;
  std::optional<std::string> payment_method;
  std::optional<bool>        is_recurring;
};

// inventory_id may be the row's current id or its temp_id.
struct StockRequest {
  std::string inventory_id;
  int64_t     quantity = 0;
};

struct SaleLineRequest {
  std::string inventory_id;
  int64_t     quantity = 0;
  // defaults to the inventory row's selling_price / name
  std::optional<double>      unit_price;
  std::optional<std::string> item_name;
};

struct SaleRequest {
  // replaying a known id returns the stored sale
  std::optional<db::model::Identifier> id;

  std::string user_id;
  std::string store_id;
  std::string sale_number;
  std::string customer_name;
  double      tax_amount      = 0;
  double      discount_amount = 0;
  std::string payment_method;
  std::string payment_status;
  std::string notes;
  uint64_t    sale_date_ms = 0;
};

struct SaleOutcome {
  db::model::SaleRecord                  sale;
  std::vector<db::model::SaleItemRecord> items;
  bool                                   duplicate = false;
};

// Who is asking; decides which rows a listing returns.
struct RecordScope {
  std::string           user_id;
  std::string           store_id;
  db::model::Role       role = db::model::Role::kIndividual;
};

db::RecordFilter FilterFor(const RecordScope& scope);

/*
  Entity-aware CRUD over the local store.

  Owns temporary id minting, stock validation and the atomic sale
  protocol. Every mutation has a transaction-scoped form so a caller can
  write the matching sync queue entry in the same transaction; the
  convenience forms open and commit their own.

  Errors are thrown as util:: exceptions.
*/
class RecordRepository {
 public:
  // Runs inside the sale transaction, before commit.
  using SaleHook = std::function<void(db::Transaction&, const SaleOutcome&)>;

  explicit RecordRepository(std::shared_ptr<db::Repository> store,
                            std::chrono::milliseconds        sale_lock_wait = std::chrono::milliseconds(100));

  db::Repository& Store() {
    return *store_;
  }

  // ---------------------------------------------------------------------
  // Inventory
  // ---------------------------------------------------------------------

  // Mints a temporary id when item.id is empty.
  db::model::InventoryRecord AddInventoryItem(db::Transaction& tx, db::model::InventoryRecord item);
  db::model::InventoryRecord AddInventoryItem(db::model::InventoryRecord item);

  // Forces synced=false.
  db::model::InventoryRecord UpdateInventoryItem(db::Transaction& tx, const std::string& id, const InventoryChanges& changes);
  db::model::InventoryRecord UpdateInventoryItem(const std::string& id, const InventoryChanges& changes);

  // Refused while an unsynced sale line item references the row.
  db::model::InventoryRecord DeleteInventoryItem(db::Transaction& tx, const std::string& id);

  // By primary id, then by temp_id.
  std::optional<db::model::InventoryRecord> FindInventoryItem(db::Transaction& tx, const std::string& id);

  std::optional<db::model::InventoryRecord> FindInventoryItemByTempId(db::Transaction& tx, const std::string& temp_id);

  // Sale items not yet confirmed remotely, matched by id or temp_id.
  bool HasUnsyncedSaleItems(db::Transaction& tx, const db::model::InventoryRecord& row);
  std::optional<db::model::InventoryRecord> FindInventoryItemByTempId(const std::string& temp_id);

  std::vector<db::model::InventoryRecord> ListInventory(const RecordScope& scope);

  // Throws NotFound / InsufficientStock; requests for the same item are summed.
  void ValidateStockAvailability(db::Transaction& tx, const std::vector<StockRequest>& requests);
  void ValidateStockAvailability(const std::vector<StockRequest>& requests);

  // ---------------------------------------------------------------------
  // Sales
  // ---------------------------------------------------------------------

  SaleOutcome ProcessSale(const SaleRequest& request, const std::vector<SaleLineRequest>& lines, const SaleHook& within = {});

  std::vector<db::model::SaleRecord>     ListSales(const RecordScope& scope);
  std::vector<db::model::SaleItemRecord> ListSaleItems(db::Transaction& tx, const std::string& sale_id);

  // ---------------------------------------------------------------------
  // Expenses
  // ---------------------------------------------------------------------

  db::model::ExpenseRecord AddExpense(db::Transaction& tx, db::model::ExpenseRecord expense);
  db::model::ExpenseRecord UpdateExpense(db::Transaction& tx, const std::string& id, const ExpenseChanges& changes);
  db::model::ExpenseRecord DeleteExpense(db::Transaction& tx, const std::string& id);

  std::optional<db::model::ExpenseRecord> FindExpense(db::Transaction& tx, const std::string& id);

  std::vector<db::model::ExpenseRecord> ListExpenses(const RecordScope& scope);

  // ---------------------------------------------------------------------
  // User profiles
  // ---------------------------------------------------------------------

  db::model::ProfileRecord StoreUserProfile(db::Transaction& tx, db::model::ProfileRecord profile);

  std::optional<db::model::ProfileRecord> GetUserProfile(const std::string& user_id);

  // ---------------------------------------------------------------------
  // Sync merges
  //
  // local_id is the id the payload was captured with. A row is marked
  // synced only if it was not modified after captured_updated_at_ms.
  // Missing rows (deleted locally meanwhile) are ignored.
  // ---------------------------------------------------------------------

  void ConfirmInventoryItem(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id,
                            uint64_t captured_updated_at_ms);

  void ConfirmSale(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id);

  void ConfirmExpense(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id,
                      uint64_t captured_updated_at_ms);

  void MarkInventorySynced(db::Transaction& tx, const std::string& id, uint64_t captured_updated_at_ms);
  void MarkExpenseSynced(db::Transaction& tx, const std::string& id, uint64_t captured_updated_at_ms);

  // The sale decrement reached the remote row; the caller has checked no
  // inventory edit is still queued for it.
  void SettleInventoryAfterSale(db::Transaction& tx, const std::string& id);
  void MarkProfileSynced(db::Transaction& tx, const std::string& user_id, uint64_t captured_updated_at_ms);

 private:
  std::shared_ptr<db::Repository> store_;
  std::chrono::milliseconds       sale_lock_wait_;

  // one sale in flight at a time
  std::timed_mutex sale_mutex_;
};

} // namespace tally::records
