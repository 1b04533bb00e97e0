#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/expense_record.hpp"
#include "internal/db/model/inventory_record.hpp"
#include "internal/db/model/profile_record.hpp"
#include "internal/db/model/sale_item_record.hpp"
#include "internal/db/model/sale_record.hpp"
#include "internal/db/model/sync_queue_record.hpp"
#include "internal/remote/remote_store.hpp"
#include "tally/v1.hpp"

namespace tally::sync {

// ------------------------------------------------------------------
// Identifier
// ------------------------------------------------------------------

void                  ToProto(const model::Identifier& id, v1::Identifier* out);
model::Identifier     FromProto(const v1::Identifier& id);

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

void ToProto(const db::model::InventoryRecord& record, v1::InventoryItem* out);
void ToProto(const db::model::SaleRecord& record, v1::Sale* out);
void ToProto(const db::model::SaleItemRecord& record, v1::SaleLineItem* out);
void ToProto(const db::model::ExpenseRecord& record, v1::Expense* out);
void ToProto(const db::model::ProfileRecord& record, v1::Profile* out);

db::model::InventoryRecord FromProto(const v1::InventoryItem& item);
db::model::ExpenseRecord   FromProto(const v1::Expense& expense);

// ------------------------------------------------------------------
// Queue payloads
//
// Each builder returns the serialized SyncPayload stored in
// sync_queue.data.
// ------------------------------------------------------------------

std::string InventoryInsertPayload(const db::model::InventoryRecord& record);
std::string InventoryUpdatePayload(const db::model::InventoryRecord& record, bool quantity_set);
std::string InventoryDeletePayload(const model::Identifier& target);
std::string SaleInsertPayload(const db::model::SaleRecord& sale, const std::vector<db::model::SaleItemRecord>& items);
std::string ExpenseInsertPayload(const db::model::ExpenseRecord& record);
std::string ExpenseUpdatePayload(const db::model::ExpenseRecord& record);
std::string ExpenseDeletePayload(const model::Identifier& target);
std::string ProfileUpsertPayload(const db::model::ProfileRecord& record);

// Quantity an inventory INSERT / UPDATE entry replays, if any. Used to
// carry a user-set quantity across collapsed edits.
std::optional<int64_t> ReplayedQuantity(const db::model::SyncQueueRecord& entry);

// Operation case a queue entry with (table, type) must carry;
// OPERATION_NOT_SET when the pair is not routable.
v1::SyncPayload::OperationCase ExpectedOperation(const std::string& table, db::model::OperationType type);

// Throws MalformedPayload on a parse failure, an unknown version or an
// operation that does not match the entry's (table, type), and
// UnroutableOperation when (table, type) has no handler.
v1::SyncPayload DecodePayload(const db::model::SyncQueueRecord& entry);

// ------------------------------------------------------------------
// Remote rows
// ------------------------------------------------------------------

// Rows created from a temporary id carry it as client_ref.
remote::Row InventoryRow(const v1::InventoryItem& item, bool include_quantity = true);
remote::Row SaleRow(const v1::Sale& sale);
remote::Row SaleItemRow(const v1::SaleLineItem& item, const std::string& sale_id, const std::string& inventory_id,
                        const std::string& user_id);
remote::Row ExpenseRow(const v1::Expense& expense);
remote::Row ProfileRow(const v1::Profile& profile);

} // namespace tally::sync
