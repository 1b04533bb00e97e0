#include "sync_dispatcher.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/api/types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "payload_codec.hpp"

namespace tally::sync {

using db::model::SyncQueueRecord;
using observability::IntField;
using observability::StringField;

namespace {

remote::Row Expect(const remote::RemoteResult& result, const std::string& context) {
  if (!result) {
    throw util::RemoteError(context + ": " + remote::ToString(result.code) + ": " + result.message);
  }
  return result.row;
}

std::string RemoteId(const remote::Row& row, const std::string& context) {
  auto id = remote::GetString(row, "id");
  if (!id || id->empty()) throw util::RemoteError(context + ": remote row has no id");
  return *id;
}

// Clears the processing flag however the drain ends.
class ProcessingGuard {
 public:
  explicit ProcessingGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~ProcessingGuard() {
    flag_.store(false);
  }

  ProcessingGuard(const ProcessingGuard&)            = delete;
  ProcessingGuard& operator=(const ProcessingGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

} // namespace

SyncDispatcher::SyncDispatcher(std::shared_ptr<records::RecordRepository> records, std::shared_ptr<SyncQueue> queue,
                               std::shared_ptr<remote::RemoteStore> remote, RetryPolicy retry_policy, uint32_t batch_size)
    : records_(std::move(records)),
      queue_(std::move(queue)),
      remote_(std::move(remote)),
      retry_policy_(std::move(retry_policy)),
      batch_size_(batch_size == 0 ? 50 : batch_size) {
}

DrainReport SyncDispatcher::Drain() {
  return Drain(batch_size_);
}

DrainReport SyncDispatcher::Drain(uint64_t limit) {
  DrainReport report;

  bool expected = false;
  if (!processing_.compare_exchange_strong(expected, true)) {
    TALLY_LOG_DEBUG("sync drain already in progress");
    report.already_in_progress = true;
    return report;
  }
  ProcessingGuard guard(processing_);

  const auto batch = queue_->DequeueBatch(limit);
  if (batch.empty()) return report;

  TALLY_LOG_INFO("sync drain started", {IntField("entries", static_cast<int64_t>(batch.size()))});

  auto&      metrics = observability::Metrics::Instance();
  const auto started = util::Now();

  for (const auto& entry : batch) {
    const auto operation = db::model::OperationTypeName(entry.operation_type);

    ++report.processed;
    try {
      Process(entry);
      ++report.succeeded;
      metrics.RecordOperation(entry.table_name, operation, "succeeded");
      TALLY_LOG_INFO("sync operation completed", {StringField("operation_key", entry.operation_key), StringField("table", entry.table_name),
                                                  StringField("record_id", entry.record_id)});
    } catch (const util::PermanentError& e) {
      ++report.failed;
      queue_->MarkPermanentFailure(entry.id, e.what());
      report.errors.push_back({entry.operation_key, e.what(), true});
      metrics.RecordOperation(entry.table_name, operation, "exhausted");
    } catch (const std::exception& e) {
      ++report.failed;
      const auto stored = queue_->RecordFailure(entry.id, e.what());
      report.errors.push_back({entry.operation_key, e.what(), false});
      metrics.RecordOperation(entry.table_name, operation, stored.Exhausted() ? "exhausted" : "failed");

      if (!stored.Exhausted()) {
        const auto delay = retry_policy_.DelayFor(static_cast<uint32_t>(std::max(stored.attempts - 1, 0)));
        report.retry_after = report.retry_after ? std::min(*report.retry_after, delay) : delay;
      }
    }
  }

  last_processed_ms_.store(util::NowMs());

  const auto counts = queue_->Counts();
  metrics.SetQueueDepth(counts.pending - counts.exhausted, counts.exhausted);
  metrics.ObserveDrainDurationMs(std::chrono::duration<double, std::milli>(util::Now() - started).count());

  TALLY_LOG_INFO("sync drain finished", {IntField("processed", static_cast<int64_t>(report.processed)),
                                         IntField("succeeded", static_cast<int64_t>(report.succeeded)),
                                         IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

SyncStats SyncDispatcher::GetSyncStats() {
  const auto counts = queue_->Counts();

  SyncStats stats;
  stats.pending_operations   = counts.pending;
  stats.failed_operations    = counts.exhausted;
  stats.retryable_operations = counts.retryable;
  stats.is_processing        = processing_.load();
  if (auto last = last_processed_ms_.load(); last != 0) stats.last_processed_ms = last;
  return stats;
}

uint64_t SyncDispatcher::ClearFailedOperations() {
  const auto cleared = queue_->ClearExhausted();

  const auto counts = queue_->Counts();
  observability::Metrics::Instance().SetQueueDepth(counts.pending - counts.exhausted, counts.exhausted);
  return cleared;
}

void SyncDispatcher::Process(const SyncQueueRecord& entry) {
  const auto payload = DecodePayload(entry);

  switch (payload.operation_case()) {
    case v1::SyncPayload::kInventoryInsert: return SyncInventoryInsert(entry, payload.inventory_insert());
    case v1::SyncPayload::kInventoryUpdate: return SyncInventoryUpdate(entry, payload.inventory_update());
    case v1::SyncPayload::kInventoryDelete: return SyncInventoryDelete(entry, payload.inventory_delete());
    case v1::SyncPayload::kSaleInsert: return SyncSale(entry, payload.sale_insert());
    case v1::SyncPayload::kExpenseInsert: return SyncExpenseInsert(entry, payload.expense_insert());
    case v1::SyncPayload::kExpenseUpdate: return SyncExpenseUpdate(entry, payload.expense_update());
    case v1::SyncPayload::kExpenseDelete: return SyncExpenseDelete(entry, payload.expense_delete());
    case v1::SyncPayload::kProfileUpsert: return SyncProfile(entry, payload.profile_upsert());
    case v1::SyncPayload::OPERATION_NOT_SET: break;
  }
  throw util::UnroutableOperation("no handler for " + entry.operation_key);
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

void SyncDispatcher::SyncInventoryInsert(const SyncQueueRecord& entry, const v1::InventoryInsert& op) {
  const auto& item  = op.item();
  const auto  local = FromProto(item.id());

  auto                 row = InventoryRow(item);
  remote::RemoteResult result;
  if (local.IsTemporary()) {
    result = remote_->Insert(remote::kInventoryTable, row);
  } else {
    row["id"] = local.Value();
    result    = remote_->Upsert(remote::kInventoryTable, row);
  }
  const auto remote_id = RemoteId(Expect(result, "insert inventory " + local.Value()), "insert inventory " + local.Value());

  auto tx = records_->Store().Begin();
  records_->ConfirmInventoryItem(*tx, local.Value(), remote_id, item.updated_at_ms());
  Complete(*tx, entry);
  tx->Commit();
}

void SyncDispatcher::SyncInventoryUpdate(const SyncQueueRecord& entry, const v1::InventoryUpdate& op) {
  const auto id = ResolveInventory(op.target());

  auto row = InventoryRow(op.item(), op.quantity_set());
  row.erase(remote::kClientRefColumn);
  Expect(remote_->Update(remote::kInventoryTable, id, row), "update inventory " + id);

  auto tx = records_->Store().Begin();
  records_->MarkInventorySynced(*tx, id, op.item().updated_at_ms());
  Complete(*tx, entry);
  tx->Commit();
}

void SyncDispatcher::SyncInventoryDelete(const SyncQueueRecord& entry, const v1::InventoryDelete& op) {
  const auto id = ResolveInventory(op.target());
  Expect(remote_->Delete(remote::kInventoryTable, id), "delete inventory " + id);

  auto tx = records_->Store().Begin();
  Complete(*tx, entry);
  tx->Commit();
}

std::string SyncDispatcher::ResolveInventory(const v1::Identifier& target) {
  const auto id = FromProto(target);
  if (id.IsPersistent()) return id.Value();

  auto row = records_->FindInventoryItemByTempId(id.Value());
  if (!row || !row->id.IsPersistent()) {
    throw util::UnresolvedReference("Cannot resolve inventory reference " + id.Value());
  }
  return row->id.Value();
}

bool SyncDispatcher::AdjustRemoteInventory(const std::string& inventory_id, int64_t sold) {
  auto fetched = remote_->Fetch(remote::kInventoryTable, inventory_id);
  auto current = fetched ? remote::GetInt(fetched.row, "quantity") : std::nullopt;
  if (!current) {
    TALLY_LOG_WARN("remote inventory adjustment skipped",
                   {StringField("table", remote::kInventoryTable), StringField("record_id", inventory_id), StringField("error", fetched.message)});
    return false;
  }

  remote::Row change;
  change["quantity"] = *current - sold;

  auto updated = remote_->Update(remote::kInventoryTable, inventory_id, change);
  if (!updated) {
    TALLY_LOG_WARN("remote inventory adjustment skipped",
                   {StringField("table", remote::kInventoryTable), StringField("record_id", inventory_id), StringField("error", updated.message)});
    return false;
  }
  TALLY_LOG_DEBUG("remote inventory adjusted",
                  {StringField("record_id", inventory_id), IntField("from", *current), IntField("to", *current - sold)});
  return true;
}

bool SyncDispatcher::HasQueuedInventoryEdit(db::Transaction& tx, const std::string& inventory_id) {
  auto row = records_->FindInventoryItem(tx, inventory_id);
  if (!row) return false;

  std::vector<std::string> refs{row->id.Value()};
  if (!row->temp_id.empty() && row->temp_id != row->id.Value()) refs.push_back(row->temp_id);

  for (const auto& ref : refs) {
    for (auto type : {db::model::OperationType::kInsert, db::model::OperationType::kUpdate}) {
      auto entry = queue_->Get(tx, OperationKey(db::TableName(db::Table::kInventory), type, ref));
      if (entry && !entry->synced) return true;
    }
  }
  return false;
}

// ------------------------------------------------------------------
// Sales
// ------------------------------------------------------------------

void SyncDispatcher::SyncSale(const SyncQueueRecord& entry, const v1::SaleInsert& op) {
  const auto& sale  = op.sale();
  const auto  local = FromProto(sale.id());

  // every reference must resolve before anything is written remotely
  std::vector<std::string> inventory_ids;
  inventory_ids.reserve(op.items_size());
  for (const auto& item : op.items()) inventory_ids.push_back(ResolveInventory(item.inventory_id()));

  auto                 row = SaleRow(sale);
  remote::RemoteResult result;
  if (local.IsTemporary()) {
    result = remote_->Insert(remote::kSalesTable, row);
  } else {
    row["id"] = local.Value();
    result    = remote_->Upsert(remote::kSalesTable, row);
  }
  const auto sale_id = RemoteId(Expect(result, "insert sale " + local.Value()), "insert sale " + local.Value());

  std::vector<remote::Row> item_rows;
  item_rows.reserve(op.items_size());
  for (int i = 0; i < op.items_size(); ++i) {
    item_rows.push_back(SaleItemRow(op.items(i), sale_id, inventory_ids[i], sale.user_id()));
  }
  Expect(remote_->InsertMany(remote::kSaleItemsTable, item_rows), "insert sale items " + sale_id);

  std::vector<std::string> adjusted;
  for (int i = 0; i < op.items_size(); ++i) {
    if (AdjustRemoteInventory(inventory_ids[i], op.items(i).quantity())) adjusted.push_back(inventory_ids[i]);
  }

  auto tx = records_->Store().Begin();
  records_->ConfirmSale(*tx, local.Value(), sale_id);
  // the local decrement is now mirrored remotely
  for (const auto& inventory_id : adjusted) {
    if (!HasQueuedInventoryEdit(*tx, inventory_id)) records_->SettleInventoryAfterSale(*tx, inventory_id);
  }
  Complete(*tx, entry);
  tx->Commit();
}

// ------------------------------------------------------------------
// Expenses
// ------------------------------------------------------------------

void SyncDispatcher::SyncExpenseInsert(const SyncQueueRecord& entry, const v1::ExpenseInsert& op) {
  const auto& expense = op.expense();
  const auto  local   = FromProto(expense.id());

  auto                 row = ExpenseRow(expense);
  remote::RemoteResult result;
  if (local.IsTemporary()) {
    result = remote_->Insert(remote::kExpensesTable, row);
  } else {
    row["id"] = local.Value();
    result    = remote_->Upsert(remote::kExpensesTable, row);
  }
  const auto remote_id = RemoteId(Expect(result, "insert expense " + local.Value()), "insert expense " + local.Value());

  auto tx = records_->Store().Begin();
  records_->ConfirmExpense(*tx, local.Value(), remote_id, expense.updated_at_ms());
  Complete(*tx, entry);
  tx->Commit();
}

void SyncDispatcher::SyncExpenseUpdate(const SyncQueueRecord& entry, const v1::ExpenseUpdate& op) {
  const auto id = ResolveExpense(op.target());

  auto row = ExpenseRow(op.expense());
  row.erase(remote::kClientRefColumn);
  Expect(remote_->Update(remote::kExpensesTable, id, row), "update expense " + id);

  auto tx = records_->Store().Begin();
  records_->MarkExpenseSynced(*tx, id, op.expense().updated_at_ms());
  Complete(*tx, entry);
  tx->Commit();
}

void SyncDispatcher::SyncExpenseDelete(const SyncQueueRecord& entry, const v1::ExpenseDelete& op) {
  const auto id = ResolveExpense(op.target());
  Expect(remote_->Delete(remote::kExpensesTable, id), "delete expense " + id);

  auto tx = records_->Store().Begin();
  Complete(*tx, entry);
  tx->Commit();
}

std::string SyncDispatcher::ResolveExpense(const v1::Identifier& target) {
  const auto id = FromProto(target);
  if (id.IsPersistent()) return id.Value();

  auto tx  = records_->Store().Begin();
  auto row = records_->Store().FindExpenseByTempId(*tx, id.Value());
  if (!row || !row->id.IsPersistent()) {
    throw util::UnresolvedReference("Cannot resolve expense reference " + id.Value());
  }
  return row->id.Value();
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

void SyncDispatcher::SyncProfile(const SyncQueueRecord& entry, const v1::ProfileUpsert& op) {
  const auto& profile = op.profile();
  Expect(remote_->Upsert(remote::kProfilesTable, ProfileRow(profile)), "upsert profile " + profile.user_id());

  auto tx = records_->Store().Begin();
  records_->MarkProfileSynced(*tx, profile.user_id(), profile.updated_at_ms());
  Complete(*tx, entry);
  tx->Commit();
}

void SyncDispatcher::Complete(db::Transaction& tx, const SyncQueueRecord& entry) {
  if (!queue_->MarkCompleted(tx, entry)) {
    TALLY_LOG_INFO("sync operation stays pending with newer payload", {StringField("operation_key", entry.operation_key)});
  }
}

} // namespace tally::sync
