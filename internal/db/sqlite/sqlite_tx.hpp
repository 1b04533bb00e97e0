#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tally::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's writer mutex until it commits or rolls back and uses
  BEGIN IMMEDIATE so the file write lock is taken up front.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  bool                         finished_ = false;
};

} // namespace tally::db::sqlite
