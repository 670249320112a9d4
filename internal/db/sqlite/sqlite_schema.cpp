#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace registry::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS registry_state (id INTEGER PRIMARY KEY CHECK (id = 1), last_asset_id INTEGER NOT NULL, administrator TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS assets (asset_id INTEGER PRIMARY KEY, name TEXT NOT NULL, owner TEXT NOT NULL, size_bytes INTEGER NOT NULL, created_at INTEGER NOT NULL, description TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS asset_tags (asset_id INTEGER NOT NULL REFERENCES assets(asset_id) ON DELETE CASCADE, position INTEGER NOT NULL, tag TEXT NOT NULL, PRIMARY KEY (asset_id, position));",
      // No foreign key: access rows outlive the asset they refer to.
      "CREATE TABLE IF NOT EXISTS asset_access (asset_id INTEGER NOT NULL, principal TEXT NOT NULL, read_enabled INTEGER NOT NULL, PRIMARY KEY (asset_id, principal));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,last_asset_id,administrator FROM registry_state LIMIT 1;");
  db.Exec("SELECT asset_id,name,owner,size_bytes,created_at,description FROM assets LIMIT 1;");
  db.Exec("SELECT asset_id,position,tag FROM asset_tags LIMIT 1;");
  db.Exec("SELECT asset_id,principal,read_enabled FROM asset_access LIMIT 1;");
}

} // namespace registry::db::sqlite
