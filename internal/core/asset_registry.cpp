#include "asset_registry.hpp"

#include "internal/observability/logging.hpp"

namespace registry::core {

using registry::observability::IdField;
using registry::observability::StringField;

namespace {

registry::v1::AssetRecord ToProto(const registry::db::model::AssetRecord& record) {
  registry::v1::AssetRecord asset;
  asset.set_asset_id(record.asset_id);
  asset.set_name(record.name);
  asset.set_owner(record.owner);
  asset.set_size_bytes(record.size_bytes);
  asset.set_created_at(record.created_at);
  asset.set_description(record.description);
  for (const auto& tag : record.tags) {
    asset.add_tags(tag);
  }
  return asset;
}

} // namespace

AssetRegistry::AssetRegistry(std::shared_ptr<registry::db::Repository> repository)
    : repository_(repository), store_(repository), access_(repository) {
}

void AssetRegistry::Initialize(const std::string& administrator) {
  auto       tx    = repository_->Begin();
  const auto state = store_.Initialize(*tx, administrator);
  tx->Commit();

  REGISTRY_LOG_INFO("Registry initialized", {StringField("administrator", state.administrator),
                                             IdField("last_asset_id", state.last_asset_id)});
}

uint64_t AssetRegistry::CreateAsset(const registry::v1::CallContext& ctx, const AssetFields& fields) {
  auto       tx       = repository_->Begin();
  const auto asset_id = store_.Create(*tx, ctx, fields);
  access_.GrantCreator(*tx, asset_id, ctx.caller());
  tx->Commit();

  REGISTRY_LOG_DEBUG("Asset created", {IdField("asset_id", asset_id), StringField("owner", ctx.caller())});
  return asset_id;
}

void AssetRegistry::UpdateAsset(const registry::v1::CallContext& ctx, uint64_t asset_id, const AssetFields& fields) {
  auto tx = repository_->Begin();
  store_.Update(*tx, ctx, asset_id, fields);
  tx->Commit();
}

void AssetRegistry::TransferOwnership(const registry::v1::CallContext& ctx, uint64_t asset_id, const std::string& new_owner) {
  auto tx = repository_->Begin();
  store_.Transfer(*tx, ctx, asset_id, new_owner);
  tx->Commit();
}

void AssetRegistry::DeleteAsset(const registry::v1::CallContext& ctx, uint64_t asset_id) {
  auto tx = repository_->Begin();
  store_.Delete(*tx, ctx, asset_id);
  tx->Commit();

  REGISTRY_LOG_DEBUG("Asset deleted", {IdField("asset_id", asset_id)});
}

registry::v1::AssetRecord AssetRegistry::GetAssetInformation(const registry::v1::CallContext& ctx, uint64_t asset_id) {
  auto       tx     = repository_->Begin();
  const auto record = store_.Require(*tx, asset_id);
  access_.RequireReadable(*tx, record, ctx.caller());
  tx->Rollback();
  return ToProto(record);
}

registry::v1::AccessStatus AssetRegistry::VerifyAccessStatus(uint64_t asset_id, const std::string& principal) {
  auto       tx     = repository_->Begin();
  const auto record = store_.Require(*tx, asset_id);
  auto       status = access_.Status(*tx, record, principal);
  tx->Rollback();
  return status;
}

std::string AssetRegistry::GetAssetOwner(uint64_t asset_id) {
  auto tx    = repository_->Begin();
  auto owner = store_.Require(*tx, asset_id).owner;
  tx->Rollback();
  return owner;
}

registry::v1::RegistryStatistics AssetRegistry::GetRegistryStatistics() {
  auto       tx    = repository_->Begin();
  const auto state = store_.State(*tx);
  tx->Rollback();

  registry::v1::RegistryStatistics stats;
  stats.set_total_assets_registered(state.last_asset_id);
  stats.set_system_administrator(state.administrator);
  return stats;
}

} // namespace registry::core
