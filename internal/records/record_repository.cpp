#include "record_repository.hpp"

#include <map>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tally::records {

using db::model::ExpenseRecord;
using db::model::Identifier;
using db::model::InventoryRecord;
using db::model::ProfileRecord;
using db::model::SaleItemRecord;
using db::model::SaleRecord;
using observability::IntField;
using observability::StringField;
using util::ThrowIfDbError;

namespace {

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

db::RecordFilter FilterFor(const RecordScope& scope) {
  db::RecordFilter filter;
  switch (scope.role) {
    case db::model::Role::kOwner:
    case db::model::Role::kWorker:
      if (!scope.store_id.empty()) {
        filter.store_id = scope.store_id;
        return filter;
      }
      break;
    case db::model::Role::kIndividual:
      break;
  }
  filter.user_id = scope.user_id;
  return filter;
}

RecordRepository::RecordRepository(std::shared_ptr<db::Repository> store, std::chrono::milliseconds sale_lock_wait)
    : store_(std::move(store)), sale_lock_wait_(sale_lock_wait) {
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

InventoryRecord RecordRepository::AddInventoryItem(db::Transaction& tx, InventoryRecord item) {
  if (item.user_id.empty()) throw util::InvalidArgument("inventory item requires user_id");
  if (item.name.empty()) throw util::InvalidArgument("inventory item requires a name");
  if (item.quantity < 0) throw util::InvalidArgument("inventory quantity cannot be negative");

  if (item.id.Empty()) item.id = Identifier::MintTemporary();
  if (item.id.IsTemporary()) {
    if (item.temp_id.empty()) item.temp_id = item.id.Value();
    item.is_offline = true;
  }

  const auto now     = util::NowMs();
  item.synced        = false;
  item.created_at_ms = item.created_at_ms ? item.created_at_ms : now;
  item.updated_at_ms = now;

  ThrowIfDbError(store_->InsertInventory(tx, item), "insert inventory " + item.id.Value());
  return item;
}

InventoryRecord RecordRepository::AddInventoryItem(InventoryRecord item) {
  auto tx     = store_->Begin();
  auto stored = AddInventoryItem(*tx, std::move(item));
  tx->Commit();
  return stored;
}

InventoryRecord RecordRepository::UpdateInventoryItem(db::Transaction& tx, const std::string& id, const InventoryChanges& changes) {
  auto row = FindInventoryItem(tx, id);
  if (!row) throw util::NotFound("Item " + id + " not found in inventory");

  const auto current_id = row->id.Value();
  if (changes.name) row->name = *changes.name;
  if (changes.sku) row->sku = *changes.sku;
  if (changes.category) row->category = *changes.category;
  if (changes.store_id) row->store_id = *changes.store_id;
  if (changes.quantity) {
    if (*changes.quantity < 0) throw util::InvalidArgument("inventory quantity cannot be negative");
    row->quantity = *changes.quantity;
  }
  if (changes.cost_price) row->cost_price = *changes.cost_price;
  if (changes.selling_price) row->selling_price = *changes.selling_price;
  if (changes.minimum_stock_level) row->minimum_stock_level = *changes.minimum_stock_level;
  if (changes.is_active) row->is_active = *changes.is_active;

  row->synced        = false;
  row->updated_at_ms = util::NowMs();

  ThrowIfDbError(store_->UpdateInventory(tx, current_id, *row), "update inventory " + current_id);
  return *row;
}

InventoryRecord RecordRepository::UpdateInventoryItem(const std::string& id, const InventoryChanges& changes) {
  auto tx     = store_->Begin();
  auto stored = UpdateInventoryItem(*tx, id, changes);
  tx->Commit();
  return stored;
}

InventoryRecord RecordRepository::DeleteInventoryItem(db::Transaction& tx, const std::string& id) {
  auto row = FindInventoryItem(tx, id);
  if (!row) throw util::NotFound("Item " + id + " not found in inventory");

  if (HasUnsyncedSaleItems(tx, *row)) {
    throw util::InvalidState("inventory item " + row->id.Value() + " is referenced by unsynced sale items");
  }

  ThrowIfDbError(store_->DeleteInventory(tx, row->id.Value()), "delete inventory " + row->id.Value());
  return *row;
}

bool RecordRepository::HasUnsyncedSaleItems(db::Transaction& tx, const InventoryRecord& row) {
  auto referenced = [&](const std::string& ref) {
    if (ref.empty()) return false;
    for (const auto& item : store_->ListSaleItemsByInventory(tx, ref)) {
      if (!item.synced) return true;
    }
    return false;
  };
  return referenced(row.id.Value()) || (row.temp_id != row.id.Value() && referenced(row.temp_id));
}

std::optional<InventoryRecord> RecordRepository::FindInventoryItem(db::Transaction& tx, const std::string& id) {
  if (auto row = store_->GetInventory(tx, id)) return row;
  return store_->FindInventoryByTempId(tx, id);
}

std::optional<InventoryRecord> RecordRepository::FindInventoryItemByTempId(db::Transaction& tx, const std::string& temp_id) {
  return store_->FindInventoryByTempId(tx, temp_id);
}

std::optional<InventoryRecord> RecordRepository::FindInventoryItemByTempId(const std::string& temp_id) {
  auto tx = store_->Begin();
  return FindInventoryItemByTempId(*tx, temp_id);
}

std::vector<InventoryRecord> RecordRepository::ListInventory(const RecordScope& scope) {
  auto tx = store_->Begin();
  return store_->ListInventory(*tx, FilterFor(scope));
}

void RecordRepository::ValidateStockAvailability(db::Transaction& tx, const std::vector<StockRequest>& requests) {
  // keyed by the row's current id so temp and persistent references add up
  std::map<std::string, int64_t>         requested;
  std::map<std::string, InventoryRecord> rows;

  for (const auto& request : requests) {
    if (request.quantity <= 0) {
      throw util::InvalidArgument("Requested quantity for " + request.inventory_id + " must be positive");
    }
    auto row = FindInventoryItem(tx, request.inventory_id);
    if (!row) throw util::NotFound("Item " + request.inventory_id + " not found in inventory");

    const auto key = row->id.Value();
    requested[key] += request.quantity;
    rows.emplace(key, std::move(*row));
  }

  for (const auto& [key, quantity] : requested) {
    const auto& row = rows.at(key);
    if (quantity > row.quantity) {
      throw util::InsufficientStock("Insufficient stock for " + row.name + ". Available: " + std::to_string(row.quantity) +
                                    ", Requested: " + std::to_string(quantity));
    }
  }
}

void RecordRepository::ValidateStockAvailability(const std::vector<StockRequest>& requests) {
  auto tx = store_->Begin();
  ValidateStockAvailability(*tx, requests);
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

SaleOutcome RecordRepository::ProcessSale(const SaleRequest& request, const std::vector<SaleLineRequest>& lines, const SaleHook& within) {
  std::unique_lock<std::timed_mutex> lock(sale_mutex_, std::defer_lock);
  if (!lock.try_lock_for(sale_lock_wait_)) {
    throw util::Busy("Sale processing is busy, please try again");
  }

  if (request.user_id.empty()) throw util::InvalidArgument("sale requires user_id");
  if (lines.empty()) throw util::InvalidArgument("sale requires at least one line item");

  const auto sale_id = request.id ? *request.id : Identifier::MintTemporary();

  auto tx = store_->Begin();

  // replay of a sale that already exists locally
  auto existing = store_->GetSale(*tx, sale_id.Value());
  if (!existing) existing = store_->FindSaleByTempId(*tx, sale_id.Value());
  if (existing) {
    SaleOutcome outcome;
    outcome.items     = store_->ListSaleItems(*tx, existing->id.Value());
    outcome.sale      = std::move(*existing);
    outcome.duplicate = true;
    TALLY_LOG_INFO("sale already exists", {StringField("sale_id", outcome.sale.id.Value())});
    return outcome;
  }

  std::vector<StockRequest> stock;
  stock.reserve(lines.size());
  for (const auto& line : lines) stock.push_back({line.inventory_id, line.quantity});
  ValidateStockAvailability(*tx, stock);

  const auto now = util::NowMs();

  SaleOutcome outcome;
  auto&       sale   = outcome.sale;
  sale.id            = sale_id;
  sale.temp_id       = sale_id.IsTemporary() ? sale_id.Value() : std::string();
  sale.user_id       = request.user_id;
  sale.store_id      = request.store_id;
  sale.sale_number   = request.sale_number;
  sale.customer_name = request.customer_name;
  sale.tax_amount    = request.tax_amount;
  sale.discount_amount = request.discount_amount;
  sale.payment_method  = request.payment_method;
  sale.payment_status  = request.payment_status;
  sale.notes           = request.notes;
  sale.sale_date_ms    = request.sale_date_ms ? request.sale_date_ms : now;
  sale.synced          = false;
  sale.is_offline      = sale_id.IsTemporary();
  sale.created_at_ms   = now;
  sale.updated_at_ms   = now;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];
    auto        row  = FindInventoryItem(*tx, line.inventory_id);
    if (!row) throw util::NotFound("Item " + line.inventory_id + " not found in inventory");

    SaleItemRecord item;
    item.id            = db::model::SaleItemId(sale_id.Value(), i);
    item.sale_id       = sale_id.Value();
    item.inventory_id  = row->id;
    item.user_id       = request.user_id;
    item.item_name     = line.item_name.value_or(row->name);
    item.quantity      = line.quantity;
    item.unit_price    = line.unit_price.value_or(row->selling_price);
    item.line_total    = static_cast<double>(item.quantity) * item.unit_price;
    item.synced        = false;
    item.created_at_ms = now;
    item.updated_at_ms = now;

    sale.subtotal += item.line_total;
    outcome.items.push_back(std::move(item));
  }
  sale.total_amount = sale.subtotal + sale.tax_amount - sale.discount_amount;

  ThrowIfDbError(store_->InsertSale(*tx, sale), "insert sale " + sale.id.Value());

  for (const auto& item : outcome.items) {
    if (store_->GetSaleItem(*tx, item.id)) continue;
    ThrowIfDbError(store_->InsertSaleItem(*tx, item), "insert sale item " + item.id);
  }

  // re-read per line so repeated items decrement cumulatively
  for (const auto& item : outcome.items) {
    auto row = store_->GetInventory(*tx, item.inventory_id.Value());
    if (!row) throw util::NotFound("Item " + item.inventory_id.Value() + " not found in inventory");

    row->quantity -= item.quantity;
    if (row->quantity < 0) {
      throw util::InsufficientStock("Insufficient stock for " + row->name + ". Available: " +
                                    std::to_string(row->quantity + item.quantity) + ", Requested: " + std::to_string(item.quantity));
    }
    row->synced        = false;
    row->updated_at_ms = now;
    ThrowIfDbError(store_->UpdateInventory(*tx, row->id.Value(), *row), "decrement inventory " + row->id.Value());
  }

  if (within) within(*tx, outcome);

  tx->Commit();

  TALLY_LOG_INFO("sale recorded", {StringField("sale_id", sale.id.Value()), IntField("items", static_cast<int64_t>(outcome.items.size())),
                                   StringField("total", FormatNumber(sale.total_amount))});
  return outcome;
}

std::vector<SaleRecord> RecordRepository::ListSales(const RecordScope& scope) {
  auto tx = store_->Begin();
  return store_->ListSales(*tx, FilterFor(scope));
}

std::vector<SaleItemRecord> RecordRepository::ListSaleItems(db::Transaction& tx, const std::string& sale_id) {
  return store_->ListSaleItems(tx, sale_id);
}

// ------------------------------------------------------------------
// Expenses
// ------------------------------------------------------------------

ExpenseRecord RecordRepository::AddExpense(db::Transaction& tx, ExpenseRecord expense) {
  if (expense.user_id.empty()) throw util::InvalidArgument("expense requires user_id");
  if (expense.amount < 0) throw util::InvalidArgument("expense amount cannot be negative");

  if (expense.id.Empty()) expense.id = Identifier::MintTemporary();
  if (expense.id.IsTemporary()) {
    if (expense.temp_id.empty()) expense.temp_id = expense.id.Value();
    expense.is_offline = true;
  }

  const auto now          = util::NowMs();
  expense.synced          = false;
  expense.expense_date_ms = expense.expense_date_ms ? expense.expense_date_ms : now;
  expense.created_at_ms   = expense.created_at_ms ? expense.created_at_ms : now;
  expense.updated_at_ms   = now;

  ThrowIfDbError(store_->InsertExpense(tx, expense), "insert expense " + expense.id.Value());
  return expense;
}

ExpenseRecord RecordRepository::UpdateExpense(db::Transaction& tx, const std::string& id, const ExpenseChanges& changes) {
  auto row = FindExpense(tx, id);
  if (!row) throw util::NotFound("Expense " + id + " not found");

  const auto current_id = row->id.Value();
  if (changes.title) row->title = *changes.title;
  if (changes.category) row->category = *changes.category;
  if (changes.description) row->description = *changes.description;
  if (changes.amount) {
    if (*changes.amount < 0) throw util::InvalidArgument("expense amount cannot be negative");
    row->amount = *changes.amount;
  }
  if (changes.expense_date_ms) row->expense_date_ms = *changes.expense_date_ms;
  if (changes.vendor) row->vendor = *changes.vendor;
  if (changes.payment_method) row->payment_method = *changes.payment_method;
  if (changes.is_recurring) row->is_recurring = *changes.is_recurring;

  row->synced        = false;
  row->updated_at_ms = util::NowMs();

  ThrowIfDbError(store_->UpdateExpense(tx, current_id, *row), "update expense " + current_id);
  return *row;
}

ExpenseRecord RecordRepository::DeleteExpense(db::Transaction& tx, const std::string& id) {
  auto row = FindExpense(tx, id);
  if (!row) throw util::NotFound("Expense " + id + " not found");

  ThrowIfDbError(store_->DeleteExpense(tx, row->id.Value()), "delete expense " + row->id.Value());
  return *row;
}

std::optional<ExpenseRecord> RecordRepository::FindExpense(db::Transaction& tx, const std::string& id) {
  if (auto row = store_->GetExpense(tx, id)) return row;
  return store_->FindExpenseByTempId(tx, id);
}

std::vector<ExpenseRecord> RecordRepository::ListExpenses(const RecordScope& scope) {
  auto tx = store_->Begin();
  return store_->ListExpenses(*tx, FilterFor(scope));
}

// ------------------------------------------------------------------
// User profiles
// ------------------------------------------------------------------

ProfileRecord RecordRepository::StoreUserProfile(db::Transaction& tx, ProfileRecord profile) {
  if (profile.user_id.empty()) throw util::InvalidArgument("profile requires user_id");

  const auto now = util::NowMs();
  if (auto existing = store_->GetProfileByUserId(tx, profile.user_id)) {
    profile.id            = existing->id;
    profile.created_at_ms = existing->created_at_ms;
  } else {
    if (profile.id.empty()) profile.id = "profile_" + profile.user_id;
    profile.created_at_ms = now;
  }
  profile.synced        = false;
  profile.updated_at_ms = now;

  ThrowIfDbError(store_->UpsertProfile(tx, profile), "upsert profile " + profile.user_id);
  return profile;
}

std::optional<ProfileRecord> RecordRepository::GetUserProfile(const std::string& user_id) {
  auto tx = store_->Begin();
  return store_->GetProfileByUserId(*tx, user_id);
}

// ------------------------------------------------------------------
// Sync merges
// ------------------------------------------------------------------

void RecordRepository::ConfirmInventoryItem(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id,
                                            uint64_t captured_updated_at_ms) {
  auto row = FindInventoryItem(tx, local_id);
  if (!row) return;

  const auto current_id = row->id.Value();
  if (row->id.IsTemporary() && row->temp_id.empty()) row->temp_id = current_id;
  row->id         = Identifier::Persistent(persistent_id);
  row->is_offline = false;
  row->synced     = row->updated_at_ms <= captured_updated_at_ms;

  ThrowIfDbError(store_->UpdateInventory(tx, current_id, *row), "confirm inventory " + current_id);
}

void RecordRepository::ConfirmSale(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id) {
  auto row = store_->GetSale(tx, local_id);
  if (!row) row = store_->FindSaleByTempId(tx, local_id);
  if (!row) return;

  const auto current_id = row->id.Value();
  if (row->id.IsTemporary() && row->temp_id.empty()) row->temp_id = current_id;
  row->id         = Identifier::Persistent(persistent_id);
  row->is_offline = false;
  row->synced     = true;
  ThrowIfDbError(store_->UpdateSale(tx, current_id, *row), "confirm sale " + current_id);

  for (auto item : store_->ListSaleItems(tx, persistent_id)) {
    if (item.synced) continue;
    item.synced = true;
    ThrowIfDbError(store_->UpdateSaleItem(tx, item), "confirm sale item " + item.id);
  }
}

void RecordRepository::ConfirmExpense(db::Transaction& tx, const std::string& local_id, const std::string& persistent_id,
                                      uint64_t captured_updated_at_ms) {
  auto row = FindExpense(tx, local_id);
  if (!row) return;

  const auto current_id = row->id.Value();
  if (row->id.IsTemporary() && row->temp_id.empty()) row->temp_id = current_id;
  row->id         = Identifier::Persistent(persistent_id);
  row->is_offline = false;
  row->synced     = row->updated_at_ms <= captured_updated_at_ms;

  ThrowIfDbError(store_->UpdateExpense(tx, current_id, *row), "confirm expense " + current_id);
}

void RecordRepository::MarkInventorySynced(db::Transaction& tx, const std::string& id, uint64_t captured_updated_at_ms) {
  auto row = FindInventoryItem(tx, id);
  if (!row || row->synced || row->updated_at_ms > captured_updated_at_ms) return;

  row->synced = true;
  ThrowIfDbError(store_->UpdateInventory(tx, row->id.Value(), *row), "mark inventory synced " + row->id.Value());
}

void RecordRepository::SettleInventoryAfterSale(db::Transaction& tx, const std::string& id) {
  auto row = FindInventoryItem(tx, id);
  if (!row || row->synced || row->id.IsTemporary()) return;

  row->synced = true;
  ThrowIfDbError(store_->UpdateInventory(tx, row->id.Value(), *row), "settle inventory " + row->id.Value());
}

void RecordRepository::MarkExpenseSynced(db::Transaction& tx, const std::string& id, uint64_t captured_updated_at_ms) {
  auto row = FindExpense(tx, id);
  if (!row || row->synced || row->updated_at_ms > captured_updated_at_ms) return;

  row->synced = true;
  ThrowIfDbError(store_->UpdateExpense(tx, row->id.Value(), *row), "mark expense synced " + row->id.Value());
}

void RecordRepository::MarkProfileSynced(db::Transaction& tx, const std::string& user_id, uint64_t captured_updated_at_ms) {
  auto row = store_->GetProfileByUserId(tx, user_id);
  if (!row || row->synced || row->updated_at_ms > captured_updated_at_ms) return;

  row->synced = true;
  ThrowIfDbError(store_->UpsertProfile(tx, *row), "mark profile synced " + user_id);
}

} // namespace tally::records
