#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace registry::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::RegistryStateRecord> GetRegistryState(Transaction&) override;
  Result PutRegistryState(Transaction&, const model::RegistryStateRecord&) override;

  Result InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAsset(Transaction&, uint64_t asset_id) override;
  Result UpdateAsset(Transaction&, const model::AssetRecord&) override;
  Result DeleteAsset(Transaction&, uint64_t asset_id) override;

  Result UpsertAccess(Transaction&, const model::AccessRecord&) override;
  std::optional<model::AccessRecord> GetAccess(Transaction&, uint64_t asset_id,
                                               const std::string& principal) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result ReplaceTags(sqlite3* db, const model::AssetRecord& r);
};

}
