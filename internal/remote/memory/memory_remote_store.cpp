#include "memory_remote_store.hpp"

#include "internal/util/uuid.hpp"

namespace tally::remote::memory {

namespace {

void Merge(Row& into, const Row& from) {
  for (const auto& [column, value] : from) {
    if (column == "id") continue;
    into[column] = value;
  }
}

RemoteResult UnknownTable(const std::string& table) {
  return RemoteResult::Err(RemoteCode::Rejected, "unknown table " + table);
}

} // namespace

MemoryRemoteStore::MemoryRemoteStore() {
  for (const char* table : {kInventoryTable, kSalesTable, kSaleItemsTable, kExpensesTable, kProfilesTable}) {
    tables_.emplace(table, Table{});
  }
}

MemoryRemoteStore::Table* MemoryRemoteStore::Find(const std::string& table) {
  auto it = tables_.find(table);
  return it == tables_.end() ? nullptr : &it->second;
}

const MemoryRemoteStore::Table* MemoryRemoteStore::Find(const std::string& table) const {
  auto it = tables_.find(table);
  return it == tables_.end() ? nullptr : &it->second;
}

std::string MemoryRemoteStore::ConflictColumn(const std::string& table) {
  return table == kProfilesTable ? "user_id" : "id";
}

RemoteResult MemoryRemoteStore::Insert(const std::string& table, const Row& row) {
  std::lock_guard lock(mutex_);
  auto*           rows = Find(table);
  if (!rows) return UnknownTable(table);

  auto client_ref = GetString(row, kClientRefColumn);
  if (client_ref && !client_ref->empty()) {
    for (auto& [id, existing] : *rows) {
      if (GetString(existing, kClientRefColumn) == client_ref) {
        Merge(existing, row);
        return RemoteResult::Ok(existing);
      }
    }
  }

  auto id = GetString(row, "id").value_or("");
  if (id.empty()) {
    id = util::ToString(util::GenerateUUID());
  } else if (rows->count(id)) {
    return RemoteResult::Err(RemoteCode::Rejected, "duplicate key " + id + " in " + table);
  }

  Row stored  = row;
  stored["id"] = id;
  auto [it, _] = rows->emplace(id, std::move(stored));
  return RemoteResult::Ok(it->second);
}

RemoteResult MemoryRemoteStore::InsertMany(const std::string& table, const std::vector<Row>& rows) {
  std::lock_guard lock(mutex_);
  auto*           stored = Find(table);
  if (!stored) return UnknownTable(table);

  for (const auto& row : rows) {
    auto id = GetString(row, "id").value_or("");
    if (id.empty()) id = util::ToString(util::GenerateUUID());
    if (stored->count(id)) continue;

    Row copy   = row;
    copy["id"] = id;
    stored->emplace(id, std::move(copy));
  }
  return RemoteResult::Ok();
}

RemoteResult MemoryRemoteStore::Update(const std::string& table, const std::string& id, const Row& row) {
  std::lock_guard lock(mutex_);
  auto*           rows = Find(table);
  if (!rows) return UnknownTable(table);

  auto it = rows->find(id);
  if (it == rows->end()) return RemoteResult::Err(RemoteCode::NotFound, table + " " + id + " not found");

  Merge(it->second, row);
  return RemoteResult::Ok(it->second);
}

RemoteResult MemoryRemoteStore::Delete(const std::string& table, const std::string& id) {
  std::lock_guard lock(mutex_);
  auto*           rows = Find(table);
  if (!rows) return UnknownTable(table);

  rows->erase(id);
  return RemoteResult::Ok();
}

RemoteResult MemoryRemoteStore::Upsert(const std::string& table, const Row& row) {
  std::lock_guard lock(mutex_);
  auto*           rows = Find(table);
  if (!rows) return UnknownTable(table);

  const auto column = ConflictColumn(table);
  auto       key    = GetString(row, column);
  if (!key || key->empty()) return RemoteResult::Err(RemoteCode::Rejected, "upsert into " + table + " requires " + column);

  for (auto& [id, existing] : *rows) {
    if (GetString(existing, column) == key) {
      Merge(existing, row);
      return RemoteResult::Ok(existing);
    }
  }

  auto id = column == "id" ? *key : util::ToString(util::GenerateUUID());

  Row stored   = row;
  stored["id"] = id;
  auto [it, _] = rows->emplace(id, std::move(stored));
  return RemoteResult::Ok(it->second);
}

RemoteResult MemoryRemoteStore::Fetch(const std::string& table, const std::string& id) {
  std::lock_guard lock(mutex_);
  auto*           rows = Find(table);
  if (!rows) return UnknownTable(table);

  auto it = rows->find(id);
  if (it == rows->end()) return RemoteResult::Err(RemoteCode::NotFound, table + " " + id + " not found");
  return RemoteResult::Ok(it->second);
}

std::vector<Row> MemoryRemoteStore::Rows(const std::string& table) const {
  std::lock_guard  lock(mutex_);
  std::vector<Row> out;
  if (const auto* rows = Find(table)) {
    for (const auto& [_, row] : *rows) out.push_back(row);
  }
  return out;
}

std::size_t MemoryRemoteStore::Count(const std::string& table) const {
  std::lock_guard lock(mutex_);
  const auto*     rows = Find(table);
  return rows ? rows->size() : 0;
}

} // namespace tally::remote::memory
