#include "sqlite_tx.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace registry::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& ex) {
      spdlog::warn("sqlite rollback failed: {}", ex.what());
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace registry::db::sqlite
