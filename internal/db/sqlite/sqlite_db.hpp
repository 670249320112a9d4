#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace registry::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
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

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace registry::db::sqlite
