#include "sync_queue.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tally::sync {

using db::model::OperationType;
using db::model::SyncQueueRecord;
using observability::BoolField;
using observability::IntField;
using observability::StringField;
using util::ThrowIfDbError;

std::string OperationKey(std::string_view table, OperationType type, std::string_view record_id) {
  std::string key;
  key.reserve(table.size() + record_id.size() + 10);
  key.append(table).append(":").append(db::model::OperationTypeName(type)).append(":").append(record_id);
  return key;
}

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> store, int32_t max_attempts)
    : store_(std::move(store)), max_attempts_(max_attempts > 0 ? max_attempts : 3) {
}

SyncQueueRecord SyncQueue::Enqueue(db::Transaction& tx, const std::string& operation_key, const std::string& table_name,
                                   const std::string& record_id, OperationType type, std::string data) {
  if (operation_key.empty()) throw util::InvalidArgument("operation key is required");
  if (table_name.empty()) throw util::InvalidArgument("table name is required");

  const auto now = util::NowMs();

  if (auto existing = store_->GetSyncOperationByKey(tx, operation_key)) {
    const bool reopened = existing->synced;

    existing->table_name     = table_name;
    existing->record_id      = record_id;
    existing->operation_type = type;
    existing->data           = std::move(data);
    existing->updated_at_ms  = now;
    if (reopened) {
      existing->synced        = false;
      existing->attempts      = 0;
      existing->max_attempts  = max_attempts_;
      existing->error_message = std::nullopt;
      existing->created_at_ms = now;
    }

    ThrowIfDbError(store_->UpdateSyncOperation(tx, *existing), "enqueue " + operation_key);
    TALLY_LOG_DEBUG("sync operation replaced", {StringField("operation_key", operation_key), StringField("table", table_name),
                                                StringField("record_id", record_id), BoolField("reopened", reopened)});
    return *existing;
  }

  SyncQueueRecord record;
  record.operation_key  = operation_key;
  record.table_name     = table_name;
  record.record_id      = record_id;
  record.operation_type = type;
  record.data           = std::move(data);
  record.max_attempts   = max_attempts_;
  record.created_at_ms  = now;
  record.updated_at_ms  = now;

  ThrowIfDbError(store_->InsertSyncOperation(tx, record), "enqueue " + operation_key);
  TALLY_LOG_DEBUG("sync operation queued",
                  {StringField("operation_key", operation_key), StringField("table", table_name), StringField("record_id", record_id)});
  return record;
}

SyncQueueRecord SyncQueue::Enqueue(const std::string& operation_key, const std::string& table_name, const std::string& record_id,
                                   OperationType type, std::string data) {
  auto tx     = store_->Begin();
  auto stored = Enqueue(*tx, operation_key, table_name, record_id, type, std::move(data));
  tx->Commit();
  return stored;
}

SyncQueueRecord SyncQueue::Requeue(db::Transaction& tx, const std::string& operation_key, const std::string& table_name,
                                   const std::string& record_id, OperationType type, std::string data) {
  auto existing = store_->GetSyncOperationByKey(tx, operation_key);
  if (!existing || existing->synced) return Enqueue(tx, operation_key, table_name, record_id, type, std::move(data));

  // a fresh row id orders it after entries sharing its timestamp
  ThrowIfDbError(store_->DeleteSyncOperation(tx, existing->id), "requeue " + operation_key);

  const auto now = util::NowMs();

  SyncQueueRecord record;
  record.operation_key  = operation_key;
  record.table_name     = table_name;
  record.record_id      = record_id;
  record.operation_type = type;
  record.data           = std::move(data);
  record.attempts       = existing->attempts;
  record.max_attempts   = existing->max_attempts;
  record.error_message  = existing->error_message;
  record.created_at_ms  = std::max(now, existing->created_at_ms);
  record.updated_at_ms  = now;

  ThrowIfDbError(store_->InsertSyncOperation(tx, record), "requeue " + operation_key);
  TALLY_LOG_DEBUG("sync operation moved to tail",
                  {StringField("operation_key", operation_key), StringField("table", table_name), StringField("record_id", record_id),
                   IntField("attempts", record.attempts)});
  return record;
}

std::vector<SyncQueueRecord> SyncQueue::DequeueBatch(uint64_t limit) {
  db::SyncQueueFilter filter;
  filter.pending_only   = true;
  filter.retryable_only = true;
  if (limit > 0) filter.limit = limit;

  auto tx = store_->Begin();
  return store_->ListSyncOperations(*tx, filter);
}

std::vector<SyncQueueRecord> SyncQueue::ListPending() {
  auto tx = store_->Begin();
  return store_->ListSyncOperations(*tx, db::SyncQueueFilter{});
}

std::optional<SyncQueueRecord> SyncQueue::Get(db::Transaction& tx, const std::string& operation_key) {
  return store_->GetSyncOperationByKey(tx, operation_key);
}

std::optional<SyncQueueRecord> SyncQueue::Get(const std::string& operation_key) {
  auto tx = store_->Begin();
  return Get(*tx, operation_key);
}

bool SyncQueue::MarkCompleted(db::Transaction& tx, const SyncQueueRecord& dequeued) {
  auto current = store_->GetSyncOperation(tx, dequeued.id);
  if (!current || current->synced) return true;

  if (current->data != dequeued.data) {
    TALLY_LOG_DEBUG("sync operation changed while in flight", {StringField("operation_key", current->operation_key)});
    return false;
  }

  current->synced        = true;
  current->error_message = std::nullopt;
  current->updated_at_ms = util::NowMs();
  ThrowIfDbError(store_->UpdateSyncOperation(tx, *current), "complete " + current->operation_key);
  return true;
}

SyncQueueRecord SyncQueue::RecordFailure(int64_t id, const std::string& message) {
  return Fail(id, message, false);
}

SyncQueueRecord SyncQueue::MarkPermanentFailure(int64_t id, const std::string& message) {
  return Fail(id, message, true);
}

SyncQueueRecord SyncQueue::Fail(int64_t id, const std::string& message, bool permanent) {
  auto tx      = store_->Begin();
  auto current = store_->GetSyncOperation(*tx, id);
  if (!current) throw util::NotFound("sync operation " + std::to_string(id));

  current->attempts      = permanent ? std::max(current->max_attempts, current->attempts + 1) : current->attempts + 1;
  current->error_message = message;
  current->updated_at_ms = util::NowMs();
  ThrowIfDbError(store_->UpdateSyncOperation(*tx, *current), "fail " + current->operation_key);
  tx->Commit();

  if (current->Exhausted()) {
    TALLY_LOG_WARN(permanent ? "sync operation failed permanently" : "sync operation exhausted",
                   {StringField("operation_key", current->operation_key), StringField("table", current->table_name),
                    StringField("record_id", current->record_id), IntField("attempts", current->attempts),
                    StringField("error", message)});
  } else {
    TALLY_LOG_INFO("sync operation failed",
                   {StringField("operation_key", current->operation_key), StringField("table", current->table_name),
                    StringField("record_id", current->record_id), IntField("attempts", current->attempts),
                    StringField("error", message)});
  }
  return *current;
}

bool SyncQueue::CancelPending(db::Transaction& tx, const std::string& operation_key) {
  auto current = store_->GetSyncOperationByKey(tx, operation_key);
  if (!current || current->synced) return false;

  ThrowIfDbError(store_->DeleteSyncOperation(tx, current->id), "cancel " + operation_key);
  TALLY_LOG_DEBUG("sync operation cancelled", {StringField("operation_key", operation_key)});
  return true;
}

uint64_t SyncQueue::ClearExhausted() {
  auto     tx      = store_->Begin();
  uint64_t cleared = 0;
  for (auto& record : store_->ListSyncOperations(*tx, db::SyncQueueFilter{})) {
    if (!record.Exhausted()) continue;
    record.synced        = true;
    record.updated_at_ms = util::NowMs();
    ThrowIfDbError(store_->UpdateSyncOperation(*tx, record), "clear " + record.operation_key);
    ++cleared;
  }
  tx->Commit();

  TALLY_LOG_INFO("cleared failed sync operations", {IntField("cleared", static_cast<int64_t>(cleared))});
  return cleared;
}

QueueCounts SyncQueue::Counts() {
  db::SyncQueueFilter all;
  all.pending_only = false;

  auto        tx = store_->Begin();
  QueueCounts counts;
  for (const auto& record : store_->ListSyncOperations(*tx, all)) {
    if (record.synced) {
      ++counts.completed;
      continue;
    }
    ++counts.pending;
    if (record.Exhausted()) {
      ++counts.exhausted;
    } else {
      ++counts.retryable;
    }
  }
  return counts;
}

} // namespace tally::sync
