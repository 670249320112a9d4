#include "asset_store.hpp"

#include <stdexcept>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::core {

using registry::db::Transaction;
using registry::db::model::AssetRecord;
using registry::db::model::RegistryStateRecord;

AssetStore::AssetStore(std::shared_ptr<registry::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("asset store requires a repository");
  }
}

RegistryStateRecord AssetStore::Initialize(Transaction& tx, const std::string& administrator) {
  if (auto existing = repository_->GetRegistryState(tx)) {
    if (existing->administrator != administrator) {
      REGISTRY_LOG_WARN("Registry already initialized; keeping recorded administrator",
                        {registry::observability::StringField("recorded", existing->administrator),
                         registry::observability::StringField("configured", administrator)});
    }
    return *existing;
  }

  ValidatePrincipal(administrator, "administrator");

  RegistryStateRecord state;
  state.last_asset_id = 0;
  state.administrator = administrator;
  ThrowIfDbError(repository_->PutRegistryState(tx, state), "initialize registry");
  return state;
}

RegistryStateRecord AssetStore::State(Transaction& tx) const {
  auto state = repository_->GetRegistryState(tx);
  if (!state) {
    throw std::logic_error("registry is not initialized");
  }
  return *state;
}

uint64_t AssetStore::Create(Transaction& tx, const registry::v1::CallContext& ctx, const AssetFields& fields) {
  ValidateAssetFields(fields);

  auto state = State(tx);

  AssetRecord record;
  record.asset_id    = state.last_asset_id + 1;
  record.name        = fields.name;
  record.owner       = ctx.caller();
  record.size_bytes  = fields.size_bytes;
  record.created_at  = ctx.block_height();
  record.description = fields.description;
  record.tags        = fields.tags;

  ThrowIfDbError(repository_->InsertAsset(tx, record), "create asset " + std::to_string(record.asset_id));

  state.last_asset_id = record.asset_id;
  ThrowIfDbError(repository_->PutRegistryState(tx, state), "advance asset counter");
  return record.asset_id;
}

void AssetStore::Update(Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id, const AssetFields& fields) {
  auto record = RequireOwned(tx, ctx, asset_id);
  ValidateAssetFields(fields);

  record.name        = fields.name;
  record.size_bytes  = fields.size_bytes;
  record.description = fields.description;
  record.tags        = fields.tags;
  ThrowIfDbError(repository_->UpdateAsset(tx, record), "update asset " + std::to_string(asset_id));
}

void AssetStore::Transfer(Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id, const std::string& new_owner) {
  auto record = RequireOwned(tx, ctx, asset_id);
  ValidatePrincipal(new_owner, "new owner");

  record.owner = new_owner;
  ThrowIfDbError(repository_->UpdateAsset(tx, record), "transfer asset " + std::to_string(asset_id));
}

void AssetStore::Delete(Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id) {
  RequireOwned(tx, ctx, asset_id);
  ThrowIfDbError(repository_->DeleteAsset(tx, asset_id), "delete asset " + std::to_string(asset_id));
}

AssetRecord AssetStore::Require(Transaction& tx, uint64_t asset_id) const {
  auto record = repository_->GetAsset(tx, asset_id);
  if (!record) {
    throw registry::util::AssetNotFound("asset " + std::to_string(asset_id) + " does not exist");
  }
  return std::move(*record);
}

AssetRecord AssetStore::RequireOwned(Transaction& tx, const registry::v1::CallContext& ctx, uint64_t asset_id) const {
  auto record = Require(tx, asset_id);
  if (record.owner != ctx.caller()) {
    throw registry::util::PermissionDenied("caller " + ctx.caller() + " does not own asset " + std::to_string(asset_id));
  }
  return record;
}

} // namespace registry::core
