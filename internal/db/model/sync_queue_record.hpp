#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tally::db::model {

enum class OperationType {
  kInsert,
  kUpdate,
  kDelete,
};

inline const char* OperationTypeName(OperationType type) {
  switch (type) {
    case OperationType::kInsert: return "INSERT";
    case OperationType::kUpdate: return "UPDATE";
    case OperationType::kDelete: return "DELETE";
  }
  return "";
}

inline std::optional<OperationType> ParseOperationType(const std::string& name) {
  if (name == "INSERT") return OperationType::kInsert;
  if (name == "UPDATE") return OperationType::kUpdate;
  if (name == "DELETE") return OperationType::kDelete;
  return std::nullopt;
}

/*
  Pending mutation awaiting replay against the remote backend.

  - operation_key is unique
  - id is assigned by the store on insert and breaks created_at ties
  - synced = completed; attempts >= max_attempts = exhausted
*/
struct SyncQueueRecord {
  int64_t id = 0;

  std::string   operation_key;
  std::string   table_name;
  std::string   record_id;
  OperationType operation_type = OperationType::kInsert;

  // binary tally.sync.v1.SyncPayload
  std::string data;

  int32_t attempts     = 0;
  int32_t max_attempts = 3;
  bool    synced       = false;

  std::optional<std::string> error_message;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  bool Exhausted() const {
    return !synced && attempts >= max_attempts;
  }
};

} // namespace tally::db::model
