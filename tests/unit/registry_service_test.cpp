#include "internal/service/registry_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace registry::v1;
using registry::factory::Application;

Application MakeApp() {
  registry::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_registry()->set_administrator("registry-admin");
  return registry::factory::Build(config);
}

void SetContext(CallContext* context, const std::string& caller) {
  context->set_caller(caller);
  context->set_block_height(42);
}

uint64_t Create(registry::service::RegistryService& svc, const std::string& caller) {
  CreateAssetRequest req;
  SetContext(req.mutable_context(), caller);
  req.set_name("dataset");
  req.set_size_bytes(2048);
  req.set_description("training data");
  req.add_tags("ml");
  req.add_tags("raw");
  return svc.CreateAsset(req).asset_id();
}

void TestBuildInitializesAdministrator() {
  auto app = MakeApp();
  assert(app.repository);
  assert(app.registry);
  assert(app.registry_service);

  const auto stats = app.registry_service->GetRegistryStatistics(GetRegistryStatisticsRequest{}).statistics();
  assert(stats.total_assets_registered() == 0);
  assert(stats.system_administrator() == "registry-admin");
}

void TestRequestsFlowThroughRegistry() {
  auto  app = MakeApp();
  auto& svc = *app.registry_service;

  const auto id = Create(svc, "alice");
  assert(id == 1);

  GetAssetInformationRequest info_req;
  SetContext(info_req.mutable_context(), "alice");
  info_req.set_asset_id(id);
  const auto asset = svc.GetAssetInformation(info_req).asset();
  assert(asset.name() == "dataset");
  assert(asset.owner() == "alice");
  assert(asset.created_at() == 42);
  assert(asset.tags_size() == 2);
  assert(asset.tags(0) == "ml");

  TransferOwnershipRequest transfer;
  SetContext(transfer.mutable_context(), "alice");
  transfer.set_asset_id(id);
  transfer.set_new_owner("bob");
  svc.TransferOwnership(transfer);

  GetAssetOwnerRequest owner_req;
  owner_req.set_asset_id(id);
  assert(svc.GetAssetOwner(owner_req).owner() == "bob");

  VerifyAccessStatusRequest access_req;
  access_req.set_asset_id(id);
  access_req.set_principal("alice");
  const auto status = svc.VerifyAccessStatus(access_req).status();
  assert(status.has_granted_access());
  assert(!status.is_asset_owner());
  assert(status.can_read_asset());

  DeleteAssetRequest delete_req;
  SetContext(delete_req.mutable_context(), "bob");
  delete_req.set_asset_id(id);
  svc.DeleteAsset(delete_req);

  const auto stats = svc.GetRegistryStatistics(GetRegistryStatisticsRequest{}).statistics();
  assert(stats.total_assets_registered() == 1);
}

void TestRegistryErrorsAreRethrown() {
  auto  app = MakeApp();
  auto& svc = *app.registry_service;

  const auto id = Create(svc, "alice");

  UpdateAssetRequest update;
  SetContext(update.mutable_context(), "mallory");
  update.set_asset_id(id);
  update.set_name("stolen");
  update.set_size_bytes(1);
  update.set_description("x");
  update.add_tags("x");

  bool threw = false;
  try {
    svc.UpdateAsset(update);
  } catch (const registry::util::PermissionDenied& ex) {
    threw = true;
    assert(ex.Code() == 106);
  }
  assert(threw);

  GetAssetOwnerRequest owner_req;
  owner_req.set_asset_id(999);
  threw = false;
  try {
    (void)svc.GetAssetOwner(owner_req);
  } catch (const registry::util::AssetNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestServiceRequiresRegistry() {
  bool threw = false;
  try {
    registry::service::RegistryService svc(registry::service::ServiceContext{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  // The registry is the only dependency.
  auto repo     = std::make_shared<registry::db::memory::MemoryRepository>();
  auto assets   = std::make_shared<registry::core::AssetRegistry>(repo);
  assets->Initialize("registry-admin");

  registry::service::RegistryService only_registry(registry::service::ServiceContext{.registry = assets});
  assert(only_registry.GetRegistryStatistics(GetRegistryStatisticsRequest{}).statistics().system_administrator() == "registry-admin");
}

} // namespace

int main() {
  TestBuildInitializesAdministrator();
  TestRequestsFlowThroughRegistry();
  TestRegistryErrorsAreRethrown();
  TestServiceRequiresRegistry();

  std::cout << "asset_registry_unit_registry_service: pass\n";
  return 0;
}
