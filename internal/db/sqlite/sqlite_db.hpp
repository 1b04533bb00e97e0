#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace tally::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is shared by every transaction; writer_mutex_
  serializes them so BEGIN IMMEDIATE never nests on one connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace tally::db::sqlite
