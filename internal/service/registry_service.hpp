#pragma once

#include "registry/v1.hpp"
#include "service_context.hpp"

namespace registry::service {

/*
  Request/response surface over AssetRegistry.

  Failures are logged with route, asset id, caller and error kind, then
  rethrown unchanged.
*/
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  registry::v1::CreateAssetResponse
  CreateAsset(const registry::v1::CreateAssetRequest& req);

  registry::v1::UpdateAssetResponse
  UpdateAsset(const registry::v1::UpdateAssetRequest& req);

  registry::v1::TransferOwnershipResponse
  TransferOwnership(const registry::v1::TransferOwnershipRequest& req);

  registry::v1::DeleteAssetResponse
  DeleteAsset(const registry::v1::DeleteAssetRequest& req);

  registry::v1::GetAssetInformationResponse
  GetAssetInformation(const registry::v1::GetAssetInformationRequest& req);

  registry::v1::VerifyAccessStatusResponse
  VerifyAccessStatus(const registry::v1::VerifyAccessStatusRequest& req);

  registry::v1::GetAssetOwnerResponse
  GetAssetOwner(const registry::v1::GetAssetOwnerRequest& req);

  registry::v1::GetRegistryStatisticsResponse
  GetRegistryStatistics(const registry::v1::GetRegistryStatisticsRequest& req);

private:
  ServiceContext ctx_;
};

}
