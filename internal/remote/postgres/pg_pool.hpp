#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace tally::remote::postgres {

/*
  PgPool

  Bounded connection pool for the remote store.

  - libpqxx connections are not thread-safe; a connection is held by one
    caller at a time and returns to the pool when its shared_ptr drops
  - Acquire blocks while max_connections are checked out
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4);

  std::shared_ptr<pqxx::connection> Acquire();

  // Broken connections are closed instead of returned.
  void Discard(std::shared_ptr<pqxx::connection> conn);

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace tally::remote::postgres
