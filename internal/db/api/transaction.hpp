#pragma once

namespace registry::db {

/*
  Abstract transaction.

  One public registry operation runs inside exactly one transaction.

  - Writes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards every write
  - Destructor rolls back if Commit() was never reached

  Memory: snapshot copy + swap on commit
  SQLite: BEGIN IMMEDIATE
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has completed
  virtual bool IsCommitted() const = 0;
};

} // namespace registry::db
