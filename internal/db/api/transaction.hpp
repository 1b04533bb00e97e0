#pragma once

namespace tally::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Single writer: opening a transaction blocks while another one is
    open on the same store. Never open a second transaction on the
    thread that already holds one.

  SQLite: BEGIN IMMEDIATE under the connection's writer mutex
  Memory: snapshot copy under the repository's writer mutex
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

} // namespace tally::db
