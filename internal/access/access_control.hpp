#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "registry/v1/asset.pb.h"

namespace registry::access {

/*
  Access Control Layer.

  Read-path authorization only. Ownership is checked by the Asset Store on
  writes; this layer merges ownership with the per-asset read list.

  Default deny: a missing (asset_id, principal) row reads as false.
*/
class AccessControl {
 public:
  explicit AccessControl(std::shared_ptr<registry::db::Repository> repository);

  // The only automatic grant, written when an asset is created.
  void GrantCreator(registry::db::Transaction& tx, uint64_t asset_id, const std::string& creator);

  bool HasGrant(registry::db::Transaction& tx, uint64_t asset_id, const std::string& principal) const;

  registry::v1::AccessStatus Status(registry::db::Transaction& tx, const registry::db::model::AssetRecord& asset,
                                    const std::string& principal) const;

  // Throws ContentRestricted unless the principal owns or was granted the asset.
  void RequireReadable(registry::db::Transaction& tx, const registry::db::model::AssetRecord& asset, const std::string& principal) const;

 private:
  std::shared_ptr<registry::db::Repository> repository_;
};

} // namespace registry::access
