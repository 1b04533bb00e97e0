#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/remote/remote_store.hpp"

namespace tally::remote::memory {

/*
  In-process remote backend.

  Serves tests and offline demos. Ids are random UUIDs; tables are
  limited to the known remote tables.
*/
class MemoryRemoteStore final : public RemoteStore {
 public:
  MemoryRemoteStore();

  RemoteResult Insert(const std::string& table, const Row& row) override;
  RemoteResult InsertMany(const std::string& table, const std::vector<Row>& rows) override;
  RemoteResult Update(const std::string& table, const std::string& id, const Row& row) override;
  RemoteResult Delete(const std::string& table, const std::string& id) override;
  RemoteResult Upsert(const std::string& table, const Row& row) override;
  RemoteResult Fetch(const std::string& table, const std::string& id) override;

  // Snapshot of a table, ordered by id.
  std::vector<Row> Rows(const std::string& table) const;
  std::size_t      Count(const std::string& table) const;

 private:
  using Table = std::map<std::string, Row>;

  Table*       Find(const std::string& table);
  const Table* Find(const std::string& table) const;

  static std::string ConflictColumn(const std::string& table);

  mutable std::mutex           mutex_;
  std::map<std::string, Table> tables_;
};

} // namespace tally::remote::memory
