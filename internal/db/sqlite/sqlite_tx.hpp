#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace registry::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - takes the write lock up front
    - every registry operation is serialized against other writers
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
