#include "migrations.hpp"

namespace tally::db::sql {

const std::vector<Migration>& LocalStoreMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS inventory ("
           " id TEXT PRIMARY KEY, id_kind INTEGER NOT NULL DEFAULT 0, temp_id TEXT UNIQUE,"
           " user_id TEXT NOT NULL, store_id TEXT, name TEXT NOT NULL, sku TEXT, category TEXT,"
           " quantity INTEGER NOT NULL DEFAULT 0, cost_price REAL NOT NULL DEFAULT 0,"
           " selling_price REAL NOT NULL DEFAULT 0, minimum_stock_level INTEGER NOT NULL DEFAULT 0,"
           " is_active INTEGER NOT NULL DEFAULT 1, synced INTEGER NOT NULL DEFAULT 0,"
           " is_offline INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS sales ("
           " id TEXT PRIMARY KEY, id_kind INTEGER NOT NULL DEFAULT 0, temp_id TEXT UNIQUE,"
           " user_id TEXT NOT NULL, store_id TEXT, sale_number TEXT, customer_name TEXT,"
           " subtotal REAL NOT NULL DEFAULT 0, tax_amount REAL NOT NULL DEFAULT 0,"
           " discount_amount REAL NOT NULL DEFAULT 0, total_amount REAL NOT NULL DEFAULT 0,"
           " payment_method TEXT, payment_status TEXT, sale_date_ms INTEGER NOT NULL, notes TEXT,"
           " synced INTEGER NOT NULL DEFAULT 0, is_offline INTEGER NOT NULL DEFAULT 0,"
           " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS sale_items ("
           " id TEXT PRIMARY KEY,"
           " sale_id TEXT NOT NULL REFERENCES sales(id) ON UPDATE CASCADE ON DELETE CASCADE,"
           " inventory_id TEXT NOT NULL, inventory_id_kind INTEGER NOT NULL DEFAULT 0,"
           " user_id TEXT NOT NULL, item_name TEXT NOT NULL, quantity INTEGER NOT NULL DEFAULT 0,"
           " unit_price REAL NOT NULL DEFAULT 0, line_total REAL NOT NULL DEFAULT 0,"
           " synced INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE INDEX IF NOT EXISTS idx_sale_items_sale ON sale_items(sale_id);",
           "CREATE INDEX IF NOT EXISTS idx_sale_items_inventory ON sale_items(inventory_id);",

           "CREATE TABLE IF NOT EXISTS expenses ("
           " id TEXT PRIMARY KEY, id_kind INTEGER NOT NULL DEFAULT 0, temp_id TEXT UNIQUE,"
           " user_id TEXT NOT NULL, store_id TEXT, title TEXT, category TEXT, description TEXT,"
           " amount REAL NOT NULL DEFAULT 0, expense_date_ms INTEGER NOT NULL, vendor TEXT,"
           " payment_method TEXT, is_recurring INTEGER NOT NULL DEFAULT 0,"
           " synced INTEGER NOT NULL DEFAULT 0, is_offline INTEGER NOT NULL DEFAULT 0,"
           " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS user_profiles ("
           " id TEXT PRIMARY KEY, user_id TEXT UNIQUE NOT NULL,"
           " role TEXT NOT NULL CHECK (role IN ('individual', 'owner', 'worker')),"
           " store_id TEXT, business_name TEXT, email TEXT, first_name TEXT, last_name TEXT, phone TEXT,"
           " synced INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE TABLE IF NOT EXISTS sync_queue ("
           " id INTEGER PRIMARY KEY AUTOINCREMENT, operation_key TEXT UNIQUE NOT NULL,"
           " table_name TEXT NOT NULL, record_id TEXT NOT NULL,"
           " operation_type TEXT NOT NULL CHECK (operation_type IN ('INSERT', 'UPDATE', 'DELETE')),"
           " data BLOB NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL DEFAULT 3,"
           " synced INTEGER NOT NULL DEFAULT 0, error_message TEXT,"
           " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

           "CREATE INDEX IF NOT EXISTS idx_sync_queue_pending ON sync_queue(synced, created_at_ms, id);",

           "CREATE TABLE IF NOT EXISTS cache_entries ("
           " key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
       }},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int applied = executor.AppliedVersion();
  int       count   = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= applied) continue;
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.MarkApplied(migration.version);
    ++count;
  }
  return count;
}

} // namespace tally::db::sql
