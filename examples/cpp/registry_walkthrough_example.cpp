#include <cstdint>
#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "registry/v1.hpp"

namespace {

void SetCaller(registry::v1::CallContext* context, const std::string& caller, uint64_t height) {
  context->set_caller(caller);
  context->set_block_height(height);
}

} // namespace

int main(int argc, char** argv) {
  // Optional administrator override for trying different identities.
  const std::string administrator = argc > 1 ? argv[1] : "registry-admin";

  registry::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_registry()->set_administrator(administrator);

  auto  app     = registry::factory::Build(config);
  auto& service = *app.registry_service;

  registry::v1::CreateAssetRequest create;
  SetCaller(create.mutable_context(), "alice", 1);
  create.set_name("doc");
  create.set_size_bytes(100);
  create.set_description("x");
  create.add_tags("a");
  const auto asset_id = service.CreateAsset(create).asset_id();
  std::cout << "alice registered asset " << asset_id << '\n';

  registry::v1::TransferOwnershipRequest transfer;
  SetCaller(transfer.mutable_context(), "alice", 2);
  transfer.set_asset_id(asset_id);
  transfer.set_new_owner("bob");
  service.TransferOwnership(transfer);

  // alice keeps her creator grant after handing the asset to bob.
  registry::v1::VerifyAccessStatusRequest verify;
  verify.set_asset_id(asset_id);
  verify.set_principal("alice");
  const auto status = service.VerifyAccessStatus(verify).status();
  std::cout << "alice: granted=" << status.has_granted_access() << " owner=" << status.is_asset_owner()
            << " can_read=" << status.can_read_asset() << '\n';

  registry::v1::GetAssetInformationRequest info;
  SetCaller(info.mutable_context(), "carol", 3);
  info.set_asset_id(asset_id);
  try {
    (void)service.GetAssetInformation(info);
  } catch (const registry::util::RegistryError& ex) {
    std::cout << "carol was refused: " << registry::util::ErrorKindName(ex.Kind()) << " (" << ex.Code() << ")\n";
  }

  const auto stats = service.GetRegistryStatistics(registry::v1::GetRegistryStatisticsRequest{}).statistics();
  std::cout << "total registered=" << stats.total_assets_registered() << " administrator=" << stats.system_administrator() << '\n';

  return 0;
}
