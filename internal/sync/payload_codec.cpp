#include "payload_codec.hpp"

#include <type_traits>

#include "internal/db/api/types.hpp"
#include "internal/util/errors.hpp"

namespace tally::sync {

using db::model::ExpenseRecord;
using db::model::InventoryRecord;
using db::model::OperationType;
using db::model::ProfileRecord;
using db::model::SaleItemRecord;
using db::model::SaleRecord;
using remote::Field;
using remote::Row;

namespace {

std::string Serialize(v1::SyncPayload& payload) {
  payload.set_version(tally::v1::kSyncPayloadVersion);
  std::string out;
  if (!payload.SerializeToString(&out)) {
    throw util::InvalidArgument("failed to serialize sync payload");
  }
  return out;
}

Field Text(const std::string& value) {
  if (value.empty()) return nullptr;
  return value;
}

Field Int(uint64_t value) {
  return static_cast<int64_t>(value);
}

void SetClientRef(Row& row, const v1::Identifier& id, const std::string& temp_id) {
  if (id.has_temporary()) {
    row[remote::kClientRefColumn] = id.temporary();
  } else if (!temp_id.empty()) {
    row[remote::kClientRefColumn] = temp_id;
  }
}

} // namespace

// ------------------------------------------------------------------
// Identifier
// ------------------------------------------------------------------

void ToProto(const model::Identifier& id, v1::Identifier* out) {
  id.Visit([out](const auto& value) {
    using T = std::decay_t<decltype(value)>;
    if constexpr (std::is_same_v<T, model::TemporaryId>) {
      out->set_temporary(value.value);
    } else {
      out->set_persistent(value.value);
    }
  });
}

model::Identifier FromProto(const v1::Identifier& id) {
  switch (id.kind_case()) {
    case v1::Identifier::kTemporary: return model::Identifier::Temporary(id.temporary());
    case v1::Identifier::kPersistent: return model::Identifier::Persistent(id.persistent());
    case v1::Identifier::KIND_NOT_SET: break;
  }
  throw util::MalformedPayload("identifier without kind");
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

void ToProto(const InventoryRecord& r, v1::InventoryItem* out) {
  ToProto(r.id, out->mutable_id());
  out->set_temp_id(r.temp_id);
  out->set_user_id(r.user_id);
  out->set_store_id(r.store_id);
  out->set_name(r.name);
  out->set_sku(r.sku);
  out->set_category(r.category);
  out->set_quantity(r.quantity);
  out->set_cost_price(r.cost_price);
  out->set_selling_price(r.selling_price);
  out->set_minimum_stock_level(r.minimum_stock_level);
  out->set_is_active(r.is_active);
  out->set_updated_at_ms(r.updated_at_ms);
}

void ToProto(const SaleRecord& r, v1::Sale* out) {
  ToProto(r.id, out->mutable_id());
  out->set_temp_id(r.temp_id);
  out->set_user_id(r.user_id);
  out->set_store_id(r.store_id);
  out->set_sale_number(r.sale_number);
  out->set_customer_name(r.customer_name);
  out->set_subtotal(r.subtotal);
  out->set_tax_amount(r.tax_amount);
  out->set_discount_amount(r.discount_amount);
  out->set_total_amount(r.total_amount);
  out->set_payment_method(r.payment_method);
  out->set_payment_status(r.payment_status);
  out->set_sale_date_ms(r.sale_date_ms);
  out->set_notes(r.notes);
}

void ToProto(const SaleItemRecord& r, v1::SaleLineItem* out) {
  out->set_id(r.id);
  ToProto(r.inventory_id, out->mutable_inventory_id());
  out->set_item_name(r.item_name);
  out->set_quantity(r.quantity);
  out->set_unit_price(r.unit_price);
  out->set_line_total(r.line_total);
}

void ToProto(const ExpenseRecord& r, v1::Expense* out) {
  ToProto(r.id, out->mutable_id());
  out->set_temp_id(r.temp_id);
  out->set_user_id(r.user_id);
  out->set_store_id(r.store_id);
  out->set_title(r.title);
  out->set_category(r.category);
  out->set_description(r.description);
  out->set_amount(r.amount);
  out->set_expense_date_ms(r.expense_date_ms);
  out->set_vendor(r.vendor);
  out->set_payment_method(r.payment_method);
  out->set_is_recurring(r.is_recurring);
  out->set_updated_at_ms(r.updated_at_ms);
}

void ToProto(const ProfileRecord& r, v1::Profile* out) {
  out->set_user_id(r.user_id);
  out->set_role(db::model::RoleName(r.role));
  out->set_store_id(r.store_id);
  out->set_business_name(r.business_name);
  out->set_email(r.email);
  out->set_first_name(r.first_name);
  out->set_last_name(r.last_name);
  out->set_phone(r.phone);
  out->set_updated_at_ms(r.updated_at_ms);
}

InventoryRecord FromProto(const v1::InventoryItem& item) {
  InventoryRecord r;
  r.id                  = FromProto(item.id());
  r.temp_id             = item.temp_id();
  r.user_id             = item.user_id();
  r.store_id            = item.store_id();
  r.name                = item.name();
  r.sku                 = item.sku();
  r.category            = item.category();
  r.quantity            = item.quantity();
  r.cost_price          = item.cost_price();
  r.selling_price       = item.selling_price();
  r.minimum_stock_level = item.minimum_stock_level();
  r.is_active           = item.is_active();
  r.updated_at_ms       = item.updated_at_ms();
  return r;
}

ExpenseRecord FromProto(const v1::Expense& expense) {
  ExpenseRecord r;
  r.id              = FromProto(expense.id());
  r.temp_id         = expense.temp_id();
  r.user_id         = expense.user_id();
  r.store_id        = expense.store_id();
  r.title           = expense.title();
  r.category        = expense.category();
  r.description     = expense.description();
  r.amount          = expense.amount();
  r.expense_date_ms = expense.expense_date_ms();
  r.vendor          = expense.vendor();
  r.payment_method  = expense.payment_method();
  r.is_recurring    = expense.is_recurring();
  r.updated_at_ms   = expense.updated_at_ms();
  return r;
}

// ------------------------------------------------------------------
// Queue payloads
// ------------------------------------------------------------------

std::string InventoryInsertPayload(const InventoryRecord& record) {
  v1::SyncPayload payload;
  ToProto(record, payload.mutable_inventory_insert()->mutable_item());
  return Serialize(payload);
}

std::string InventoryUpdatePayload(const InventoryRecord& record, bool quantity_set) {
  v1::SyncPayload payload;
  auto*           op = payload.mutable_inventory_update();
  ToProto(record.id, op->mutable_target());
  ToProto(record, op->mutable_item());
  op->set_quantity_set(quantity_set);
  return Serialize(payload);
}

std::string InventoryDeletePayload(const model::Identifier& target) {
  v1::SyncPayload payload;
  ToProto(target, payload.mutable_inventory_delete()->mutable_target());
  return Serialize(payload);
}

std::string SaleInsertPayload(const SaleRecord& sale, const std::vector<SaleItemRecord>& items) {
  v1::SyncPayload payload;
  auto*           op = payload.mutable_sale_insert();
  ToProto(sale, op->mutable_sale());
  for (const auto& item : items) ToProto(item, op->add_items());
  return Serialize(payload);
}

std::string ExpenseInsertPayload(const ExpenseRecord& record) {
  v1::SyncPayload payload;
  ToProto(record, payload.mutable_expense_insert()->mutable_expense());
  return Serialize(payload);
}

std::string ExpenseUpdatePayload(const ExpenseRecord& record) {
  v1::SyncPayload payload;
  auto*           op = payload.mutable_expense_update();
  ToProto(record.id, op->mutable_target());
  ToProto(record, op->mutable_expense());
  return Serialize(payload);
}

std::string ExpenseDeletePayload(const model::Identifier& target) {
  v1::SyncPayload payload;
  ToProto(target, payload.mutable_expense_delete()->mutable_target());
  return Serialize(payload);
}

std::string ProfileUpsertPayload(const ProfileRecord& record) {
  v1::SyncPayload payload;
  ToProto(record, payload.mutable_profile_upsert()->mutable_profile());
  return Serialize(payload);
}

std::optional<int64_t> ReplayedQuantity(const db::model::SyncQueueRecord& entry) {
  v1::SyncPayload payload;
  if (!payload.ParseFromString(entry.data)) return std::nullopt;

  switch (payload.operation_case()) {
    case v1::SyncPayload::kInventoryInsert: return payload.inventory_insert().item().quantity();
    case v1::SyncPayload::kInventoryUpdate:
      if (payload.inventory_update().quantity_set()) return payload.inventory_update().item().quantity();
      return std::nullopt;
    default: return std::nullopt;
  }
}

v1::SyncPayload::OperationCase ExpectedOperation(const std::string& table, OperationType type) {
  using db::Table;
  using db::TableName;

  if (table == TableName(Table::kInventory)) {
    switch (type) {
      case OperationType::kInsert: return v1::SyncPayload::kInventoryInsert;
      case OperationType::kUpdate: return v1::SyncPayload::kInventoryUpdate;
      case OperationType::kDelete: return v1::SyncPayload::kInventoryDelete;
    }
  }
  if (table == TableName(Table::kSales) && type == OperationType::kInsert) {
    return v1::SyncPayload::kSaleInsert;
  }
  if (table == TableName(Table::kExpenses)) {
    switch (type) {
      case OperationType::kInsert: return v1::SyncPayload::kExpenseInsert;
      case OperationType::kUpdate: return v1::SyncPayload::kExpenseUpdate;
      case OperationType::kDelete: return v1::SyncPayload::kExpenseDelete;
    }
  }
  if (table == TableName(Table::kUserProfiles) && type != OperationType::kDelete) {
    return v1::SyncPayload::kProfileUpsert;
  }
  return v1::SyncPayload::OPERATION_NOT_SET;
}

v1::SyncPayload DecodePayload(const db::model::SyncQueueRecord& entry) {
  const auto expected = ExpectedOperation(entry.table_name, entry.operation_type);
  if (expected == v1::SyncPayload::OPERATION_NOT_SET) {
    throw util::UnroutableOperation("no handler for " + entry.table_name + " " + db::model::OperationTypeName(entry.operation_type));
  }

  v1::SyncPayload payload;
  if (!payload.ParseFromString(entry.data)) {
    throw util::MalformedPayload("sync payload for " + entry.operation_key + " does not parse");
  }
  if (payload.version() != tally::v1::kSyncPayloadVersion) {
    throw util::MalformedPayload("unsupported sync payload version " + std::to_string(payload.version()));
  }
  if (payload.operation_case() != expected) {
    throw util::MalformedPayload("sync payload for " + entry.operation_key + " carries the wrong operation");
  }
  return payload;
}

// ------------------------------------------------------------------
// Remote rows
// ------------------------------------------------------------------

Row InventoryRow(const v1::InventoryItem& item, bool include_quantity) {
  Row row;
  row["user_id"]             = item.user_id();
  row["store_id"]            = Text(item.store_id());
  row["name"]                = item.name();
  row["sku"]                 = Text(item.sku());
  row["category"]            = Text(item.category());
  if (include_quantity) row["quantity"] = item.quantity();
  row["cost_price"]          = item.cost_price();
  row["selling_price"]       = item.selling_price();
  row["minimum_stock_level"] = item.minimum_stock_level();
  row["is_active"]           = item.is_active();
  SetClientRef(row, item.id(), item.temp_id());
  return row;
}

Row SaleRow(const v1::Sale& sale) {
  Row row;
  row["user_id"]         = sale.user_id();
  row["store_id"]        = Text(sale.store_id());
  row["sale_number"]     = Text(sale.sale_number());
  row["customer_name"]   = Text(sale.customer_name());
  row["subtotal"]        = sale.subtotal();
  row["tax_amount"]      = sale.tax_amount();
  row["discount_amount"] = sale.discount_amount();
  row["total_amount"]    = sale.total_amount();
  row["payment_method"]  = Text(sale.payment_method());
  row["payment_status"]  = Text(sale.payment_status());
  row["sale_date_ms"]    = Int(sale.sale_date_ms());
  row["notes"]           = Text(sale.notes());
  SetClientRef(row, sale.id(), sale.temp_id());
  return row;
}

Row SaleItemRow(const v1::SaleLineItem& item, const std::string& sale_id, const std::string& inventory_id, const std::string& user_id) {
  Row row;
  row["id"]           = item.id();
  row["sale_id"]      = sale_id;
  row["inventory_id"] = inventory_id;
  row["user_id"]      = user_id;
  row["item_name"]    = item.item_name();
  row["quantity"]     = item.quantity();
  row["unit_price"]   = item.unit_price();
  row["line_total"]   = item.line_total();
  return row;
}

Row ExpenseRow(const v1::Expense& expense) {
  Row row;
  row["user_id"]         = expense.user_id();
  row["store_id"]        = Text(expense.store_id());
  row["title"]           = expense.title();
  row["category"]        = Text(expense.category());
  row["description"]     = Text(expense.description());
  row["amount"]          = expense.amount();
  row["expense_date_ms"] = Int(expense.expense_date_ms());
  row["vendor"]          = Text(expense.vendor());
  row["payment_method"]  = Text(expense.payment_method());
  row["is_recurring"]    = expense.is_recurring();
  SetClientRef(row, expense.id(), expense.temp_id());
  return row;
}

Row ProfileRow(const v1::Profile& profile) {
  Row row;
  row["user_id"]       = profile.user_id();
  row["role"]          = profile.role();
  row["store_id"]      = Text(profile.store_id());
  row["business_name"] = Text(profile.business_name());
  row["email"]         = Text(profile.email());
  row["first_name"]    = Text(profile.first_name());
  row["last_name"]     = Text(profile.last_name());
  row["phone"]         = Text(profile.phone());
  return row;
}

} // namespace tally::sync
