#pragma once

namespace tally::db::sql {

/*
  Canonical SQLite statements.

  Column order in each *_COLUMNS list is the bind order for inserts and
  the read order for selects; row readers depend on it.
*/

// inventory

#define TALLY_INVENTORY_COLUMNS                                                                                  \
  "id,id_kind,temp_id,user_id,store_id,name,sku,category,quantity,cost_price,selling_price,minimum_stock_level," \
  "is_active,synced,is_offline,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_INVENTORY =
    "INSERT INTO inventory(" TALLY_INVENTORY_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_INVENTORY = "SELECT " TALLY_INVENTORY_COLUMNS " FROM inventory WHERE id=?;";

static constexpr const char* SELECT_INVENTORY_BY_TEMP_ID =
    "SELECT " TALLY_INVENTORY_COLUMNS " FROM inventory WHERE temp_id=?;";

static constexpr const char* LIST_INVENTORY = "SELECT " TALLY_INVENTORY_COLUMNS " FROM inventory";

static constexpr const char* UPDATE_INVENTORY =
    "UPDATE inventory SET id=?,id_kind=?,temp_id=?,user_id=?,store_id=?,name=?,sku=?,category=?,quantity=?,"
    "cost_price=?,selling_price=?,minimum_stock_level=?,is_active=?,synced=?,is_offline=?,created_at_ms=?,"
    "updated_at_ms=? WHERE id=?;";

static constexpr const char* DELETE_INVENTORY = "DELETE FROM inventory WHERE id=?;";

// sales

#define TALLY_SALE_COLUMNS                                                                                      \
  "id,id_kind,temp_id,user_id,store_id,sale_number,customer_name,subtotal,tax_amount,discount_amount,"          \
  "total_amount,payment_method,payment_status,sale_date_ms,notes,synced,is_offline,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SALE =
    "INSERT INTO sales(" TALLY_SALE_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SALE = "SELECT " TALLY_SALE_COLUMNS " FROM sales WHERE id=?;";

static constexpr const char* SELECT_SALE_BY_TEMP_ID = "SELECT " TALLY_SALE_COLUMNS " FROM sales WHERE temp_id=?;";

static constexpr const char* LIST_SALES = "SELECT " TALLY_SALE_COLUMNS " FROM sales";

static constexpr const char* UPDATE_SALE =
    "UPDATE sales SET id=?,id_kind=?,temp_id=?,user_id=?,store_id=?,sale_number=?,customer_name=?,subtotal=?,"
    "tax_amount=?,discount_amount=?,total_amount=?,payment_method=?,payment_status=?,sale_date_ms=?,notes=?,"
    "synced=?,is_offline=?,created_at_ms=?,updated_at_ms=? WHERE id=?;";

// sale_items

#define TALLY_SALE_ITEM_COLUMNS \
  "id,sale_id,inventory_id,inventory_id_kind,user_id,item_name,quantity,unit_price,line_total,synced,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SALE_ITEM =
    "INSERT INTO sale_items(" TALLY_SALE_ITEM_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SALE_ITEM = "SELECT " TALLY_SALE_ITEM_COLUMNS " FROM sale_items WHERE id=?;";

static constexpr const char* LIST_SALE_ITEMS =
    "SELECT " TALLY_SALE_ITEM_COLUMNS " FROM sale_items WHERE sale_id=? ORDER BY id;";

static constexpr const char* LIST_SALE_ITEMS_BY_INVENTORY =
    "SELECT " TALLY_SALE_ITEM_COLUMNS " FROM sale_items WHERE inventory_id=? ORDER BY id;";

static constexpr const char* UPDATE_SALE_ITEM =
    "UPDATE sale_items SET sale_id=?,inventory_id=?,inventory_id_kind=?,user_id=?,item_name=?,quantity=?,"
    "unit_price=?,line_total=?,synced=?,created_at_ms=?,updated_at_ms=? WHERE id=?;";

// expenses

#define TALLY_EXPENSE_COLUMNS                                                                               \
  "id,id_kind,temp_id,user_id,store_id,title,category,description,amount,expense_date_ms,vendor,"           \
  "payment_method,is_recurring,synced,is_offline,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_EXPENSE =
    "INSERT INTO expenses(" TALLY_EXPENSE_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EXPENSE = "SELECT " TALLY_EXPENSE_COLUMNS " FROM expenses WHERE id=?;";

static constexpr const char* SELECT_EXPENSE_BY_TEMP_ID =
    "SELECT " TALLY_EXPENSE_COLUMNS " FROM expenses WHERE temp_id=?;";

static constexpr const char* LIST_EXPENSES = "SELECT " TALLY_EXPENSE_COLUMNS " FROM expenses";

static constexpr const char* UPDATE_EXPENSE =
    "UPDATE expenses SET id=?,id_kind=?,temp_id=?,user_id=?,store_id=?,title=?,category=?,description=?,amount=?,"
    "expense_date_ms=?,vendor=?,payment_method=?,is_recurring=?,synced=?,is_offline=?,created_at_ms=?,"
    "updated_at_ms=? WHERE id=?;";

static constexpr const char* DELETE_EXPENSE = "DELETE FROM expenses WHERE id=?;";

// user_profiles

#define TALLY_PROFILE_COLUMNS \
  "id,user_id,role,store_id,business_name,email,first_name,last_name,phone,synced,created_at_ms,updated_at_ms"

static constexpr const char* UPSERT_PROFILE =
    "INSERT INTO user_profiles(" TALLY_PROFILE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(user_id) DO UPDATE SET"
    " role=excluded.role,"
    " store_id=excluded.store_id,"
    " business_name=excluded.business_name,"
    " email=excluded.email,"
    " first_name=excluded.first_name,"
    " last_name=excluded.last_name,"
    " phone=excluded.phone,"
    " synced=excluded.synced,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_PROFILE_BY_USER =
    "SELECT " TALLY_PROFILE_COLUMNS " FROM user_profiles WHERE user_id=?;";

// sync_queue

#define TALLY_SYNC_QUEUE_COLUMNS                                                                         \
  "id,operation_key,table_name,record_id,operation_type,data,attempts,max_attempts,synced,error_message," \
  "created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SYNC_OPERATION =
    "INSERT INTO sync_queue(operation_key,table_name,record_id,operation_type,data,attempts,max_attempts,"
    "synced,error_message,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SYNC_OPERATION = "SELECT " TALLY_SYNC_QUEUE_COLUMNS " FROM sync_queue WHERE id=?;";

static constexpr const char* SELECT_SYNC_OPERATION_BY_KEY =
    "SELECT " TALLY_SYNC_QUEUE_COLUMNS " FROM sync_queue WHERE operation_key=?;";

static constexpr const char* LIST_SYNC_OPERATIONS = "SELECT " TALLY_SYNC_QUEUE_COLUMNS " FROM sync_queue";

static constexpr const char* UPDATE_SYNC_OPERATION =
    "UPDATE sync_queue SET operation_key=?,table_name=?,record_id=?,operation_type=?,data=?,attempts=?,"
    "max_attempts=?,synced=?,error_message=?,created_at_ms=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* DELETE_SYNC_OPERATION = "DELETE FROM sync_queue WHERE id=?;";

// cache_entries

static constexpr const char* UPSERT_CACHE_ENTRY =
    "INSERT INTO cache_entries(key,value,expires_at_ms,created_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(key) DO UPDATE SET"
    " value=excluded.value,"
    " expires_at_ms=excluded.expires_at_ms,"
    " created_at_ms=excluded.created_at_ms;";

static constexpr const char* SELECT_CACHE_ENTRY =
    "SELECT key,value,expires_at_ms,created_at_ms FROM cache_entries WHERE key=?;";

static constexpr const char* DELETE_CACHE_ENTRY = "DELETE FROM cache_entries WHERE key=?;";

static constexpr const char* DELETE_EXPIRED_CACHE_ENTRIES = "DELETE FROM cache_entries WHERE expires_at_ms<=?;";

// migrations

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_VERSION = "SELECT COALESCE(MAX(version),0) FROM schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);";

} // namespace tally::db::sql
