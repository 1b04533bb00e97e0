#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tally::sync {

// "{table}:{OP}:{record_id}"
std::string OperationKey(std::string_view table, db::model::OperationType type, std::string_view record_id);

struct QueueCounts {
  uint64_t pending   = 0; // not synced, exhausted included
  uint64_t retryable = 0;
  uint64_t exhausted = 0;
  uint64_t completed = 0;
};

/*
  Durable FIFO of pending mutations, stored in the local sync_queue table.

  Enqueue is an upsert by operation key:
    - pending key   -> payload replaced, attempts and position kept
    - completed key -> re-opened at the tail with attempts reset

  Requeue differs only for a pending key, which is moved to the tail.

  Only the dispatcher moves entries to completed / failed.
*/
class SyncQueue {
 public:
  explicit SyncQueue(std::shared_ptr<db::Repository> store, int32_t max_attempts = 3);

  db::model::SyncQueueRecord Enqueue(db::Transaction& tx, const std::string& operation_key, const std::string& table_name,
                                     const std::string& record_id, db::model::OperationType type, std::string data);

  db::model::SyncQueueRecord Enqueue(const std::string& operation_key, const std::string& table_name, const std::string& record_id,
                                     db::model::OperationType type, std::string data);

  // Like Enqueue, but a pending key also moves behind every entry queued
  // so far. Its attempts are kept.
  db::model::SyncQueueRecord Requeue(db::Transaction& tx, const std::string& operation_key, const std::string& table_name,
                                     const std::string& record_id, db::model::OperationType type, std::string data);

  // Pending, non-exhausted entries, oldest first.
  std::vector<db::model::SyncQueueRecord> DequeueBatch(uint64_t limit);

  // Every entry not yet completed, exhausted ones included.
  std::vector<db::model::SyncQueueRecord> ListPending();

  std::optional<db::model::SyncQueueRecord> Get(db::Transaction& tx, const std::string& operation_key);
  std::optional<db::model::SyncQueueRecord> Get(const std::string& operation_key);

  // Returns false and leaves the entry pending when its payload was
  // replaced after `dequeued` was read.
  bool MarkCompleted(db::Transaction& tx, const db::model::SyncQueueRecord& dequeued);

  // attempts += 1; returns the stored entry.
  db::model::SyncQueueRecord RecordFailure(int64_t id, const std::string& message);

  // attempts := max_attempts
  db::model::SyncQueueRecord MarkPermanentFailure(int64_t id, const std::string& message);

  // Drops a pending entry. Returns false when there was none.
  bool CancelPending(db::Transaction& tx, const std::string& operation_key);

  // Exhausted entries are marked completed without replay.
  uint64_t ClearExhausted();

  QueueCounts Counts();

  int32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  db::model::SyncQueueRecord Fail(int64_t id, const std::string& message, bool permanent);

  std::shared_ptr<db::Repository> store_;
  int32_t                         max_attempts_;
};

} // namespace tally::sync
