#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace registry::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::RegistryStateRecord> GetRegistryState(Transaction&) override;
  Result PutRegistryState(Transaction&, const model::RegistryStateRecord&) override;

  Result InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAsset(Transaction&, uint64_t asset_id) override;
  Result UpdateAsset(Transaction&, const model::AssetRecord&) override;
  Result DeleteAsset(Transaction&, uint64_t asset_id) override;

  Result UpsertAccess(Transaction&, const model::AccessRecord&) override;
  std::optional<model::AccessRecord> GetAccess(Transaction&, uint64_t asset_id,
                                               const std::string& principal) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::optional<model::RegistryStateRecord> registry_state;
    std::map<uint64_t, model::AssetRecord> assets;
    std::unordered_map<std::string, model::AccessRecord> access;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
