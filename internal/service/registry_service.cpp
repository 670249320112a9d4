#include "registry_service.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/core/asset_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::service {

using namespace registry::v1;
using registry::observability::IdField;
using registry::observability::IntField;
using registry::observability::StringField;

namespace {

template <typename Request>
registry::core::AssetFields ToFields(const Request& req) {
  registry::core::AssetFields fields;
  fields.name        = req.name();
  fields.size_bytes  = req.size_bytes();
  fields.description = req.description();
  fields.tags.assign(req.tags().begin(), req.tags().end());
  return fields;
}

template <typename Fn>
auto ObserveCall(std::string_view route, const CallContext& context, std::optional<uint64_t> asset_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    return fn();
  } catch (const registry::util::RegistryError& ex) {
    // Rejected by a registry rule.
    REGISTRY_LOG_WARN("Registry call rejected",
                      {StringField("route", route), StringField("caller", context.caller()),
                       IdField("asset_id", asset_id.value_or(0)),
                       StringField("kind", registry::util::ErrorKindName(ex.Kind())), StringField("error", ex.what()),
                       IntField("elapsed_ms", elapsed_ms())});
    throw;
  } catch (const std::exception& ex) {
    REGISTRY_LOG_ERROR("Registry call failed",
                       {StringField("route", route), StringField("caller", context.caller()),
                        IdField("asset_id", asset_id.value_or(0)), StringField("error", ex.what()),
                        IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.registry) {
    throw std::invalid_argument("registry service requires an asset registry");
  }
}

CreateAssetResponse RegistryService::CreateAsset(const CreateAssetRequest& req) {
  return ObserveCall("RegistryService.CreateAsset", req.context(), std::nullopt, [&] {
    CreateAssetResponse resp;
    resp.set_asset_id(ctx_.registry->CreateAsset(req.context(), ToFields(req)));
    return resp;
  });
}

UpdateAssetResponse RegistryService::UpdateAsset(const UpdateAssetRequest& req) {
  return ObserveCall("RegistryService.UpdateAsset", req.context(), req.asset_id(), [&] {
    ctx_.registry->UpdateAsset(req.context(), req.asset_id(), ToFields(req));
    return UpdateAssetResponse{};
  });
}

TransferOwnershipResponse RegistryService::TransferOwnership(const TransferOwnershipRequest& req) {
  return ObserveCall("RegistryService.TransferOwnership", req.context(), req.asset_id(), [&] {
    ctx_.registry->TransferOwnership(req.context(), req.asset_id(), req.new_owner());
    return TransferOwnershipResponse{};
  });
}

DeleteAssetResponse RegistryService::DeleteAsset(const DeleteAssetRequest& req) {
  return ObserveCall("RegistryService.DeleteAsset", req.context(), req.asset_id(), [&] {
    ctx_.registry->DeleteAsset(req.context(), req.asset_id());
    return DeleteAssetResponse{};
  });
}

GetAssetInformationResponse RegistryService::GetAssetInformation(const GetAssetInformationRequest& req) {
  return ObserveCall("RegistryService.GetAssetInformation", req.context(), req.asset_id(), [&] {
    GetAssetInformationResponse resp;
    *resp.mutable_asset() = ctx_.registry->GetAssetInformation(req.context(), req.asset_id());
    return resp;
  });
}

VerifyAccessStatusResponse RegistryService::VerifyAccessStatus(const VerifyAccessStatusRequest& req) {
  return ObserveCall("RegistryService.VerifyAccessStatus", req.context(), req.asset_id(), [&] {
    VerifyAccessStatusResponse resp;
    *resp.mutable_status() = ctx_.registry->VerifyAccessStatus(req.asset_id(), req.principal());
    return resp;
  });
}

GetAssetOwnerResponse RegistryService::GetAssetOwner(const GetAssetOwnerRequest& req) {
  return ObserveCall("RegistryService.GetAssetOwner", req.context(), req.asset_id(), [&] {
    GetAssetOwnerResponse resp;
    resp.set_owner(ctx_.registry->GetAssetOwner(req.asset_id()));
    return resp;
  });
}

GetRegistryStatisticsResponse RegistryService::GetRegistryStatistics(const GetRegistryStatisticsRequest& req) {
  return ObserveCall("RegistryService.GetRegistryStatistics", req.context(), std::nullopt, [&] {
    GetRegistryStatisticsResponse resp;
    *resp.mutable_statistics() = ctx_.registry->GetRegistryStatistics();
    return resp;
  });
}

} // namespace registry::service
