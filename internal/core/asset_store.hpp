#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/validation.hpp"
#include "internal/db/api/repository.hpp"
#include "registry/v1/asset.pb.h"

namespace registry::core {

/*
  Asset Store.

  Owns the asset rows and the registry counter. Every method runs inside a
  transaction opened by the caller; nothing here commits.

  Check order on mutations: existence, ownership, then field validation.
*/
class AssetStore {
 public:
  explicit AssetStore(std::shared_ptr<registry::db::Repository> repository);

  // Records the administrator on first use; an existing state row wins.
  registry::db::model::RegistryStateRecord Initialize(registry::db::Transaction& tx, const std::string& administrator);

  registry::db::model::RegistryStateRecord State(registry::db::Transaction& tx) const;

  // Returns the new id, last_asset_id + 1. The counter moves only here.
  uint64_t Create(registry::db::Transaction& tx, const registry::v1::CallContext& ctx, const AssetFields& fields);

  void Update(registry::db::Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id, const AssetFields& fields);
  void Transfer(registry::db::Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id, const std::string& new_owner);
  void Delete(registry::db::Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id);

  // Throws AssetNotFound.
  registry::db::model::AssetRecord Require(registry::db::Transaction& tx, uint64_t asset_id) const;

 private:
  // Throws AssetNotFound, then PermissionDenied.
  registry::db::model::AssetRecord RequireOwned(registry::db::Transaction& tx, const registry::v1::CallContext& ctx,
                                                uint64_t asset_id) const;

  std::shared_ptr<registry::db::Repository> repository_;
};

} // namespace registry::core
