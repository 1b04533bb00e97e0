#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/remote/remote_store.hpp"
#include "pg_pool.hpp"

namespace tally::remote::postgres {

/*
  RemoteStore over a PostgreSQL database (Supabase-style schema).

  Statements are built per call from the row's columns; table names come
  from a fixed allow-list and column names must be plain identifiers.
  Every call runs in its own transaction and returns the stored row via
  RETURNING *.
*/
class PgRemoteStore final : public RemoteStore {
 public:
  explicit PgRemoteStore(std::shared_ptr<PgPool> pool);

  RemoteResult Insert(const std::string& table, const Row& row) override;
  RemoteResult InsertMany(const std::string& table, const std::vector<Row>& rows) override;
  RemoteResult Update(const std::string& table, const std::string& id, const Row& row) override;
  RemoteResult Delete(const std::string& table, const std::string& id) override;
  RemoteResult Upsert(const std::string& table, const Row& row) override;
  RemoteResult Fetch(const std::string& table, const std::string& id) override;

 private:
  template <typename Fn>
  RemoteResult Run(const std::string& table, const Row& row, Fn&& fn);

  std::shared_ptr<PgPool> pool_;
};

} // namespace tally::remote::postgres
