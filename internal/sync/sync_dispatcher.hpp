#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/records/record_repository.hpp"
#include "internal/remote/remote_store.hpp"
#include "retry_policy.hpp"
#include "sync_queue.hpp"
#include "tally/v1.hpp"

namespace tally::sync {

struct DrainError {
  std::string operation_key;
  std::string message;
  bool        permanent = false;
};

struct DrainReport {
  // another drain was running; nothing was touched
  bool already_in_progress = false;

  uint64_t processed = 0;
  uint64_t succeeded = 0;
  uint64_t failed    = 0;

  std::vector<DrainError> errors;

  // smallest backoff among entries that failed and remain retryable
  std::optional<std::chrono::milliseconds> retry_after;
};

struct SyncStats {
  uint64_t pending_operations   = 0;
  uint64_t failed_operations    = 0;
  uint64_t retryable_operations = 0;
  bool     is_processing        = false;

  // completion time of the last drain that processed anything
  std::optional<uint64_t> last_processed_ms;
};

/*
  Drains the sync queue against the remote store.

  One Drain() call processes one FIFO batch. Drains are single-flight:
  a call that overlaps a running drain returns already_in_progress.

  Per entry:
    decode -> route by (table, operation) -> remote call(s)
    -> local merge + completion in one local transaction

  PermanentError exhausts the entry at once; any other failure counts
  one attempt.
*/
class SyncDispatcher {
 public:
  SyncDispatcher(std::shared_ptr<records::RecordRepository> records, std::shared_ptr<SyncQueue> queue,
                 std::shared_ptr<remote::RemoteStore> remote, RetryPolicy retry_policy = RetryPolicy(), uint32_t batch_size = 50);

  DrainReport Drain();
  DrainReport Drain(uint64_t limit);

  SyncStats GetSyncStats();

  // Exhausted entries leave the pending set without replay.
  uint64_t ClearFailedOperations();

  bool IsProcessing() const {
    return processing_.load();
  }

  uint32_t BatchSize() const {
    return batch_size_;
  }

  const RetryPolicy& Policy() const {
    return retry_policy_;
  }

 private:
  void Process(const db::model::SyncQueueRecord& entry);

  void SyncInventoryInsert(const db::model::SyncQueueRecord& entry, const v1::InventoryInsert& op);
  void SyncInventoryUpdate(const db::model::SyncQueueRecord& entry, const v1::InventoryUpdate& op);
  void SyncInventoryDelete(const db::model::SyncQueueRecord& entry, const v1::InventoryDelete& op);
  void SyncSale(const db::model::SyncQueueRecord& entry, const v1::SaleInsert& op);
  void SyncExpenseInsert(const db::model::SyncQueueRecord& entry, const v1::ExpenseInsert& op);
  void SyncExpenseUpdate(const db::model::SyncQueueRecord& entry, const v1::ExpenseUpdate& op);
  void SyncExpenseDelete(const db::model::SyncQueueRecord& entry, const v1::ExpenseDelete& op);
  void SyncProfile(const db::model::SyncQueueRecord& entry, const v1::ProfileUpsert& op);

  // Persistent id for a target; temporary ones go through the local
  // temp_id lookup. Throws UnresolvedReference.
  std::string ResolveInventory(const v1::Identifier& target);
  std::string ResolveExpense(const v1::Identifier& target);

  // Best effort; failures are logged and reported as false.
  bool AdjustRemoteInventory(const std::string& inventory_id, int64_t sold);
  bool HasQueuedInventoryEdit(db::Transaction& tx, const std::string& inventory_id);

  void Complete(db::Transaction& tx, const db::model::SyncQueueRecord& entry);

  std::shared_ptr<records::RecordRepository> records_;
  std::shared_ptr<SyncQueue>                 queue_;
  std::shared_ptr<remote::RemoteStore>       remote_;
  RetryPolicy                                retry_policy_;
  uint32_t                                   batch_size_;

  std::atomic<bool>     processing_{false};
  std::atomic<uint64_t> last_processed_ms_{0};
};

} // namespace tally::sync
