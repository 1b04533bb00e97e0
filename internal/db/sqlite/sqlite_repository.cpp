#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace tally::db::sqlite {

using tally::db::ErrorCode;
using tally::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }

  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

  // Read paths have no Result to report through.
  void RequirePrepared() const {
    if (!Prepared()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Steps a read; SQLITE_ROW or SQLITE_DONE, anything else throws.
  bool NextRow() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

model::Identifier ColIdentifier(sqlite3_stmt* st, int value_col, int kind_col) {
  return model::Identifier::FromStored(ColText(st, value_col), sqlite3_column_int(st, kind_col));
}

void BindIdentifier(sqlite3_stmt* st, int value_idx, const model::Identifier& id) {
  BindText(st, value_idx, id.Value());
  sqlite3_bind_int(st, value_idx + 1, static_cast<int>(id.GetKind()));
}

// ------------------------------------------------------------------
// Row codecs. Indices follow the *_COLUMNS lists in sql_queries.hpp.
// ------------------------------------------------------------------

void BindInventory(sqlite3_stmt* st, const model::InventoryRecord& r) {
  BindIdentifier(st, 1, r.id);
  BindOptText(st, 3, r.temp_id);
  BindText(st, 4, r.user_id);
  BindOptText(st, 5, r.store_id);
  BindText(st, 6, r.name);
  BindOptText(st, 7, r.sku);
  BindOptText(st, 8, r.category);
  BindI64(st, 9, r.quantity);
  BindDouble(st, 10, r.cost_price);
  BindDouble(st, 11, r.selling_price);
  BindI64(st, 12, r.minimum_stock_level);
  BindBool(st, 13, r.is_active);
  BindBool(st, 14, r.synced);
  BindBool(st, 15, r.is_offline);
  BindU64(st, 16, r.created_at_ms);
  BindU64(st, 17, r.updated_at_ms);
}

model::InventoryRecord ReadInventory(sqlite3_stmt* st) {
  model::InventoryRecord r;
  r.id                  = ColIdentifier(st, 0, 1);
  r.temp_id             = ColText(st, 2);
  r.user_id             = ColText(st, 3);
  r.store_id            = ColText(st, 4);
  r.name                = ColText(st, 5);
  r.sku                 = ColText(st, 6);
  r.category            = ColText(st, 7);
  r.quantity            = ColI64(st, 8);
  r.cost_price          = ColDouble(st, 9);
  r.selling_price       = ColDouble(st, 10);
  r.minimum_stock_level = ColI64(st, 11);
  r.is_active           = ColBool(st, 12);
  r.synced              = ColBool(st, 13);
  r.is_offline          = ColBool(st, 14);
  r.created_at_ms       = ColU64(st, 15);
  r.updated_at_ms       = ColU64(st, 16);
  return r;
}

void BindSale(sqlite3_stmt* st, const model::SaleRecord& r) {
  BindIdentifier(st, 1, r.id);
  BindOptText(st, 3, r.temp_id);
  BindText(st, 4, r.user_id);
  BindOptText(st, 5, r.store_id);
  BindOptText(st, 6, r.sale_number);
  BindOptText(st, 7, r.customer_name);
  BindDouble(st, 8, r.subtotal);
  BindDouble(st, 9, r.tax_amount);
  BindDouble(st, 10, r.discount_amount);
  BindDouble(st, 11, r.total_amount);
  BindOptText(st, 12, r.payment_method);
  BindOptText(st, 13, r.payment_status);
  BindU64(st, 14, r.sale_date_ms);
  BindOptText(st, 15, r.notes);
  BindBool(st, 16, r.synced);
  BindBool(st, 17, r.is_offline);
  BindU64(st, 18, r.created_at_ms);
  BindU64(st, 19, r.updated_at_ms);
}

model::SaleRecord ReadSale(sqlite3_stmt* st) {
  model::SaleRecord r;
  r.id              = ColIdentifier(st, 0, 1);
  r.temp_id         = ColText(st, 2);
  r.user_id         = ColText(st, 3);
  r.store_id        = ColText(st, 4);
  r.sale_number     = ColText(st, 5);
  r.customer_name   = ColText(st, 6);
  r.subtotal        = ColDouble(st, 7);
  r.tax_amount      = ColDouble(st, 8);
  r.discount_amount = ColDouble(st, 9);
  r.total_amount    = ColDouble(st, 10);
  r.payment_method  = ColText(st, 11);
  r.payment_status  = ColText(st, 12);
  r.sale_date_ms    = ColU64(st, 13);
  r.notes           = ColText(st, 14);
  r.synced          = ColBool(st, 15);
  r.is_offline      = ColBool(st, 16);
  r.created_at_ms   = ColU64(st, 17);
  r.updated_at_ms   = ColU64(st, 18);
  return r;
}

// Binds everything after the primary key starting at `first`.
void BindSaleItemBody(sqlite3_stmt* st, int first, const model::SaleItemRecord& r) {
  BindText(st, first, r.sale_id);
  BindIdentifier(st, first + 1, r.inventory_id);
  BindText(st, first + 3, r.user_id);
  BindText(st, first + 4, r.item_name);
  BindI64(st, first + 5, r.quantity);
  BindDouble(st, first + 6, r.unit_price);
  BindDouble(st, first + 7, r.line_total);
  BindBool(st, first + 8, r.synced);
  BindU64(st, first + 9, r.created_at_ms);
  BindU64(st, first + 10, r.updated_at_ms);
}

model::SaleItemRecord ReadSaleItem(sqlite3_stmt* st) {
  model::SaleItemRecord r;
  r.id            = ColText(st, 0);
  r.sale_id       = ColText(st, 1);
  r.inventory_id  = ColIdentifier(st, 2, 3);
  r.user_id       = ColText(st, 4);
  r.item_name     = ColText(st, 5);
  r.quantity      = ColI64(st, 6);
  r.unit_price    = ColDouble(st, 7);
  r.line_total    = ColDouble(st, 8);
  r.synced        = ColBool(st, 9);
  r.created_at_ms = ColU64(st, 10);
  r.updated_at_ms = ColU64(st, 11);
  return r;
}

void BindExpense(sqlite3_stmt* st, const model::ExpenseRecord& r) {
  BindIdentifier(st, 1, r.id);
  BindOptText(st, 3, r.temp_id);
  BindText(st, 4, r.user_id);
  BindOptText(st, 5, r.store_id);
  BindOptText(st, 6, r.title);
  BindOptText(st, 7, r.category);
  BindOptText(st, 8, r.description);
  BindDouble(st, 9, r.amount);
  BindU64(st, 10, r.expense_date_ms);
  BindOptText(st, 11, r.vendor);
  BindOptText(st, 12, r.payment_method);
  BindBool(st, 13, r.is_recurring);
  BindBool(st, 14, r.synced);
  BindBool(st, 15, r.is_offline);
  BindU64(st, 16, r.created_at_ms);
  BindU64(st, 17, r.updated_at_ms);
}

model::ExpenseRecord ReadExpense(sqlite3_stmt* st) {
  model::ExpenseRecord r;
  r.id              = ColIdentifier(st, 0, 1);
  r.temp_id         = ColText(st, 2);
  r.user_id         = ColText(st, 3);
  r.store_id        = ColText(st, 4);
  r.title           = ColText(st, 5);
  r.category        = ColText(st, 6);
  r.description     = ColText(st, 7);
  r.amount          = ColDouble(st, 8);
  r.expense_date_ms = ColU64(st, 9);
  r.vendor          = ColText(st, 10);
  r.payment_method  = ColText(st, 11);
  r.is_recurring    = ColBool(st, 12);
  r.synced          = ColBool(st, 13);
  r.is_offline      = ColBool(st, 14);
  r.created_at_ms   = ColU64(st, 15);
  r.updated_at_ms   = ColU64(st, 16);
  return r;
}

model::ProfileRecord ReadProfile(sqlite3_stmt* st) {
  model::ProfileRecord r;
  r.id            = ColText(st, 0);
  r.user_id       = ColText(st, 1);
  r.role          = model::ParseRole(ColText(st, 2)).value_or(model::Role::kIndividual);
  r.store_id      = ColText(st, 3);
  r.business_name = ColText(st, 4);
  r.email         = ColText(st, 5);
  r.first_name    = ColText(st, 6);
  r.last_name     = ColText(st, 7);
  r.phone         = ColText(st, 8);
  r.synced        = ColBool(st, 9);
  r.created_at_ms = ColU64(st, 10);
  r.updated_at_ms = ColU64(st, 11);
  return r;
}

// Binds everything after the primary key starting at `first`.
void BindSyncOperationBody(sqlite3_stmt* st, int first, const model::SyncQueueRecord& r) {
  BindText(st, first, r.operation_key);
  BindText(st, first + 1, r.table_name);
  BindText(st, first + 2, r.record_id);
  BindText(st, first + 3, model::OperationTypeName(r.operation_type));
  BindBlob(st, first + 4, r.data);
  sqlite3_bind_int(st, first + 5, r.attempts);
  sqlite3_bind_int(st, first + 6, r.max_attempts);
  BindBool(st, first + 7, r.synced);
  if (r.error_message) {
    BindText(st, first + 8, *r.error_message);
  } else {
    sqlite3_bind_null(st, first + 8);
  }
  BindU64(st, first + 9, r.created_at_ms);
  BindU64(st, first + 10, r.updated_at_ms);
}

model::SyncQueueRecord ReadSyncOperation(sqlite3_stmt* st) {
  model::SyncQueueRecord r;
  r.id             = ColI64(st, 0);
  r.operation_key  = ColText(st, 1);
  r.table_name     = ColText(st, 2);
  r.record_id      = ColText(st, 3);
  r.operation_type = model::ParseOperationType(ColText(st, 4)).value_or(model::OperationType::kInsert);
  r.data           = ColBlob(st, 5);
  r.attempts       = sqlite3_column_int(st, 6);
  r.max_attempts   = sqlite3_column_int(st, 7);
  r.synced         = ColBool(st, 8);
  if (sqlite3_column_type(st, 9) != SQLITE_NULL) {
    r.error_message = ColText(st, 9);
  }
  r.created_at_ms = ColU64(st, 10);
  r.updated_at_ms = ColU64(st, 11);
  return r;
}

std::string FilterClause(const RecordFilter& filter) {
  std::string where;
  auto        add = [&](const char* condition) {
    where += where.empty() ? " WHERE " : " AND ";
    where += condition;
  };
  if (filter.user_id) add("user_id=?");
  if (filter.store_id) add("store_id=?");
  if (filter.synced) add("synced=?");
  return where;
}

void BindFilter(sqlite3_stmt* st, const RecordFilter& filter) {
  int idx = 1;
  if (filter.user_id) BindText(st, idx++, *filter.user_id);
  if (filter.store_id) BindText(st, idx++, *filter.store_id);
  if (filter.synced) BindBool(st, idx++, *filter.synced);
}

template <typename Record, typename Reader>
std::optional<Record> SelectOne(sqlite3* db, const char* sql, const std::string& key, Reader read) {
  Statement st(db, sql);
  st.RequirePrepared();
  BindText(st.get(), 1, key);
  if (!st.NextRow()) return std::nullopt;
  return read(st.get());
}

template <typename Record, typename Reader>
std::vector<Record> SelectFiltered(sqlite3* db, const char* base_sql, const RecordFilter& filter, Reader read) {
  Statement st(db, std::string(base_sql) + FilterClause(filter) + " ORDER BY created_at_ms DESC, id;");
  st.RequirePrepared();
  BindFilter(st.get(), filter);

  std::vector<Record> out;
  while (st.NextRow()) out.push_back(read(st.get()));
  return out;
}

/*
  Migration executor bound to one connection. Runs inside the
  bootstrap transaction.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int AppliedVersion() override {
    db_.Exec(sql::CREATE_SCHEMA_MIGRATIONS);
    Statement st(db_.Handle(), sql::SELECT_SCHEMA_VERSION);
    st.RequirePrepared();
    return st.NextRow() ? sqlite3_column_int(st.get(), 0) : 0;
  }

  void MarkApplied(int version) override {
    Statement st(db_.Handle(), sql::INSERT_SCHEMA_VERSION);
    st.RequirePrepared();
    sqlite3_bind_int(st.get(), 1, version);
    BindU64(st.get(), 2, util::NowMs());
    if (st.Step() != SQLITE_DONE) {
      throw std::runtime_error(std::string("record migration: ") + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

void SqliteRepository::Bootstrap() {
  SqliteTransaction       tx(db_);
  SqliteMigrationExecutor executor(*db_);
  sql::RunMigrations(executor, sql::LocalStoreMigrations());
  tx.Commit();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

Result SqliteRepository::InsertInventory(Transaction& t, const model::InventoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_INVENTORY);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindInventory(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::InventoryRecord> SqliteRepository::GetInventory(Transaction& t, const std::string& id) {
  return SelectOne<model::InventoryRecord>(TX(t).Handle(), sql::SELECT_INVENTORY, id, ReadInventory);
}

std::optional<model::InventoryRecord> SqliteRepository::FindInventoryByTempId(Transaction& t, const std::string& temp_id) {
  return SelectOne<model::InventoryRecord>(TX(t).Handle(), sql::SELECT_INVENTORY_BY_TEMP_ID, temp_id, ReadInventory);
}

std::vector<model::InventoryRecord> SqliteRepository::ListInventory(Transaction& t, const RecordFilter& filter) {
  return SelectFiltered<model::InventoryRecord>(TX(t).Handle(), sql::LIST_INVENTORY, filter, ReadInventory);
}

Result SqliteRepository::UpdateInventory(Transaction& t, const std::string& current_id, const model::InventoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_INVENTORY);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindInventory(st.get(), r);
  BindText(st.get(), 18, current_id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "inventory " + current_id);
  return result;
}

Result SqliteRepository::DeleteInventory(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_INVENTORY);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

Result SqliteRepository::InsertSale(Transaction& t, const model::SaleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SALE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSale(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::SaleRecord> SqliteRepository::GetSale(Transaction& t, const std::string& id) {
  return SelectOne<model::SaleRecord>(TX(t).Handle(), sql::SELECT_SALE, id, ReadSale);
}

std::optional<model::SaleRecord> SqliteRepository::FindSaleByTempId(Transaction& t, const std::string& temp_id) {
  return SelectOne<model::SaleRecord>(TX(t).Handle(), sql::SELECT_SALE_BY_TEMP_ID, temp_id, ReadSale);
}

std::vector<model::SaleRecord> SqliteRepository::ListSales(Transaction& t, const RecordFilter& filter) {
  return SelectFiltered<model::SaleRecord>(TX(t).Handle(), sql::LIST_SALES, filter, ReadSale);
}

Result SqliteRepository::UpdateSale(Transaction& t, const std::string& current_id, const model::SaleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_SALE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  // sale_items.sale_id follows through ON UPDATE CASCADE
  BindSale(st.get(), r);
  BindText(st.get(), 20, current_id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "sale " + current_id);
  return result;
}

// ------------------------------------------------------------------
// Sale line items
// ------------------------------------------------------------------

Result SqliteRepository::InsertSaleItem(Transaction& t, const model::SaleItemRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SALE_ITEM);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindSaleItemBody(st.get(), 2, r);
  return Translate(db, st.Step());
}

std::optional<model::SaleItemRecord> SqliteRepository::GetSaleItem(Transaction& t, const std::string& id) {
  return SelectOne<model::SaleItemRecord>(TX(t).Handle(), sql::SELECT_SALE_ITEM, id, ReadSaleItem);
}

std::vector<model::SaleItemRecord> SqliteRepository::ListSaleItems(Transaction& t, const std::string& sale_id) {
  Statement st(TX(t).Handle(), sql::LIST_SALE_ITEMS);
  st.RequirePrepared();
  BindText(st.get(), 1, sale_id);

  std::vector<model::SaleItemRecord> out;
  while (st.NextRow()) out.push_back(ReadSaleItem(st.get()));
  return out;
}

std::vector<model::SaleItemRecord> SqliteRepository::ListSaleItemsByInventory(Transaction& t, const std::string& inventory_ref) {
  Statement st(TX(t).Handle(), sql::LIST_SALE_ITEMS_BY_INVENTORY);
  st.RequirePrepared();
  BindText(st.get(), 1, inventory_ref);

  std::vector<model::SaleItemRecord> out;
  while (st.NextRow()) out.push_back(ReadSaleItem(st.get()));
  return out;
}

Result SqliteRepository::UpdateSaleItem(Transaction& t, const model::SaleItemRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_SALE_ITEM);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSaleItemBody(st.get(), 1, r);
  BindText(st.get(), 12, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "sale item " + r.id);
  return result;
}

// ------------------------------------------------------------------
// Expenses
// ------------------------------------------------------------------

Result SqliteRepository::InsertExpense(Transaction& t, const model::ExpenseRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_EXPENSE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindExpense(st.get(), r);
  return Translate(db, st.Step());
}

std::optional<model::ExpenseRecord> SqliteRepository::GetExpense(Transaction& t, const std::string& id) {
  return SelectOne<model::ExpenseRecord>(TX(t).Handle(), sql::SELECT_EXPENSE, id, ReadExpense);
}

std::optional<model::ExpenseRecord> SqliteRepository::FindExpenseByTempId(Transaction& t, const std::string& temp_id) {
  return SelectOne<model::ExpenseRecord>(TX(t).Handle(), sql::SELECT_EXPENSE_BY_TEMP_ID, temp_id, ReadExpense);
}

std::vector<model::ExpenseRecord> SqliteRepository::ListExpenses(Transaction& t, const RecordFilter& filter) {
  return SelectFiltered<model::ExpenseRecord>(TX(t).Handle(), sql::LIST_EXPENSES, filter, ReadExpense);
}

Result SqliteRepository::UpdateExpense(Transaction& t, const std::string& current_id, const model::ExpenseRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_EXPENSE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindExpense(st.get(), r);
  BindText(st.get(), 18, current_id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "expense " + current_id);
  return result;
}

Result SqliteRepository::DeleteExpense(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_EXPENSE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// User profiles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertProfile(Transaction& t, const model::ProfileRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_PROFILE);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.user_id);
  BindText(st.get(), 3, model::RoleName(r.role));
  BindOptText(st.get(), 4, r.store_id);
  BindOptText(st.get(), 5, r.business_name);
  BindOptText(st.get(), 6, r.email);
  BindOptText(st.get(), 7, r.first_name);
  BindOptText(st.get(), 8, r.last_name);
  BindOptText(st.get(), 9, r.phone);
  BindBool(st.get(), 10, r.synced);
  BindU64(st.get(), 11, r.created_at_ms);
  BindU64(st.get(), 12, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::ProfileRecord> SqliteRepository::GetProfileByUserId(Transaction& t, const std::string& user_id) {
  return SelectOne<model::ProfileRecord>(TX(t).Handle(), sql::SELECT_PROFILE_BY_USER, user_id, ReadProfile);
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertSyncOperation(Transaction& t, model::SyncQueueRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SYNC_OPERATION);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSyncOperationBody(st.get(), 1, r);
  auto result = Translate(db, st.Step());
  if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::SyncQueueRecord> SqliteRepository::GetSyncOperation(Transaction& t, int64_t id) {
  Statement st(TX(t).Handle(), sql::SELECT_SYNC_OPERATION);
  st.RequirePrepared();
  BindI64(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadSyncOperation(st.get());
}

std::optional<model::SyncQueueRecord> SqliteRepository::GetSyncOperationByKey(Transaction& t, const std::string& operation_key) {
  return SelectOne<model::SyncQueueRecord>(TX(t).Handle(), sql::SELECT_SYNC_OPERATION_BY_KEY, operation_key, ReadSyncOperation);
}

std::vector<model::SyncQueueRecord> SqliteRepository::ListSyncOperations(Transaction& t, const SyncQueueFilter& filter) {
  std::string sql = sql::LIST_SYNC_OPERATIONS;
  std::string where;
  auto        add = [&](const char* condition) {
    where += where.empty() ? " WHERE " : " AND ";
    where += condition;
  };
  if (filter.pending_only) add("synced=0");
  if (filter.retryable_only) add("attempts<max_attempts");
  if (filter.table_name) add("table_name=?");
  sql += where + " ORDER BY created_at_ms, id";
  if (filter.limit) sql += " LIMIT ?";
  sql += ";";

  Statement st(TX(t).Handle(), sql);
  st.RequirePrepared();
  int idx = 1;
  if (filter.table_name) BindText(st.get(), idx++, *filter.table_name);
  if (filter.limit) BindU64(st.get(), idx++, *filter.limit);

  std::vector<model::SyncQueueRecord> out;
  while (st.NextRow()) out.push_back(ReadSyncOperation(st.get()));
  return out;
}

Result SqliteRepository::UpdateSyncOperation(Transaction& t, const model::SyncQueueRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_SYNC_OPERATION);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSyncOperationBody(st.get(), 1, r);
  BindI64(st.get(), 12, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "sync operation " + std::to_string(r.id));
  return result;
}

Result SqliteRepository::DeleteSyncOperation(Transaction& t, int64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_SYNC_OPERATION);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Dashboard cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_CACHE_ENTRY);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.key);
  BindText(st.get(), 2, r.value);
  BindU64(st.get(), 3, r.expires_at_ms);
  BindU64(st.get(), 4, r.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::CacheRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  return SelectOne<model::CacheRecord>(TX(t).Handle(), sql::SELECT_CACHE_ENTRY, key, [](sqlite3_stmt* st) {
    model::CacheRecord r;
    r.key           = ColText(st, 0);
    r.value         = ColText(st, 1);
    r.expires_at_ms = ColU64(st, 2);
    r.created_at_ms = ColU64(st, 3);
    return r;
  });
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_CACHE_ENTRY);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, key);
  return Translate(db, st.Step());
}

uint64_t SqliteRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_EXPIRED_CACHE_ENTRIES);
  st.RequirePrepared();

  BindU64(st.get(), 1, now_ms);
  if (st.Step() != SQLITE_DONE) throw std::runtime_error(std::string("expire cache: ") + sqlite3_errmsg(db));
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountRows(Transaction& t, Table table) {
  Statement st(TX(t).Handle(), std::string("SELECT COUNT(*) FROM ") + TableName(table) + ";");
  st.RequirePrepared();
  return st.NextRow() ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::ClearTable(Transaction& t, Table table) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("DELETE FROM ") + TableName(table) + ";");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, st.Step());
}

} // namespace tally::db::sqlite
