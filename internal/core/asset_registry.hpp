#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/core/asset_store.hpp"
#include "internal/db/api/repository.hpp"
#include "registry/v1/asset.pb.h"

namespace registry::core {

/*
  Public registry surface.

  Each operation runs in one repository transaction: mutations commit only
  after every check and write succeeded, reads never commit. A thrown
  RegistryError therefore leaves the ledger exactly as it was.
*/
class AssetRegistry {
 public:
  explicit AssetRegistry(std::shared_ptr<registry::db::Repository> repository);

  // Must run once before any other call. Reopening a ledger keeps the
  // administrator recorded the first time.
  void Initialize(const std::string& administrator);

  uint64_t CreateAsset(const registry::v1::CallContext& ctx, const AssetFields& fields);
  void     UpdateAsset(const registry::v1::CallContext& ctx, uint64_t asset_id, const AssetFields& fields);
  void     TransferOwnership(const registry::v1::CallContext& ctx, uint64_t asset_id, const std::string& new_owner);
  void     DeleteAsset(const registry::v1::CallContext& ctx, uint64_t asset_id);

  registry::v1::AssetRecord        GetAssetInformation(const registry::v1::CallContext& ctx, uint64_t asset_id);
  registry::v1::AccessStatus       VerifyAccessStatus(uint64_t asset_id, const std::string& principal);
  std::string                      GetAssetOwner(uint64_t asset_id);
  registry::v1::RegistryStatistics GetRegistryStatistics();

 private:
  std::shared_ptr<registry::db::Repository> repository_;
  AssetStore                                store_;
  registry::access::AccessControl           access_;
};

} // namespace registry::core
