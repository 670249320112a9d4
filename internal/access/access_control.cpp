#include "access_control.hpp"

#include <stdexcept>

#include "internal/core/db_error.hpp"
#include "internal/util/errors.hpp"

namespace registry::access {

AccessControl::AccessControl(std::shared_ptr<registry::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("access control requires a repository");
  }
}

void AccessControl::GrantCreator(registry::db::Transaction& tx, uint64_t asset_id, const std::string& creator) {
  registry::db::model::AccessRecord entry;
  entry.asset_id     = asset_id;
  entry.principal    = creator;
  entry.read_enabled = true;
  registry::core::ThrowIfDbError(repository_->UpsertAccess(tx, entry), "grant creator access to asset " + std::to_string(asset_id));
}

bool AccessControl::HasGrant(registry::db::Transaction& tx, uint64_t asset_id, const std::string& principal) const {
  const auto entry = repository_->GetAccess(tx, asset_id, principal);
  return entry.has_value() && entry->read_enabled;
}

registry::v1::AccessStatus AccessControl::Status(registry::db::Transaction& tx, const registry::db::model::AssetRecord& asset,
                                                 const std::string& principal) const {
  registry::v1::AccessStatus status;
  status.set_has_granted_access(HasGrant(tx, asset.asset_id, principal));
  status.set_is_asset_owner(asset.owner == principal);
  status.set_can_read_asset(status.has_granted_access() || status.is_asset_owner());
  return status;
}

void AccessControl::RequireReadable(registry::db::Transaction& tx, const registry::db::model::AssetRecord& asset,
                                    const std::string& principal) const {
  if (asset.owner == principal || HasGrant(tx, asset.asset_id, principal)) {
    return;
  }
  throw registry::util::ContentRestricted("principal " + principal + " may not read asset " + std::to_string(asset.asset_id));
}

} // namespace registry::access
