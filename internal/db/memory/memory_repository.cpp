#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace registry::db::memory {

namespace {

std::string AccessKey(uint64_t asset_id, const std::string& principal) {
  return std::to_string(asset_id) + "#" + principal;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::RegistryStateRecord> MemoryRepository::GetRegistryState(Transaction& t) {
  return TX(t).View().registry_state;
}

Result MemoryRepository::PutRegistryState(Transaction& t, const model::RegistryStateRecord& r) {
  TX(t).Mutable().registry_state = r;
  return Result::Ok();
}

Result MemoryRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.assets.contains(r.asset_id)) return Result::Err(ErrorCode::AlreadyExists, "asset " + std::to_string(r.asset_id));
  s.assets[r.asset_id] = r;
  return Result::Ok();
}

std::optional<model::AssetRecord> MemoryRepository::GetAsset(Transaction& t, uint64_t asset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(asset_id);
  if (it == s.assets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.assets.find(r.asset_id);
  if (it == s.assets.end()) return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(r.asset_id));
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAsset(Transaction& t, uint64_t asset_id) {
  auto& s = TX(t).Mutable();
  if (s.assets.erase(asset_id) == 0) return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(asset_id));
  return Result::Ok();
}

Result MemoryRepository::UpsertAccess(Transaction& t, const model::AccessRecord& r) {
  TX(t).Mutable().access[AccessKey(r.asset_id, r.principal)] = r;
  return Result::Ok();
}

std::optional<model::AccessRecord> MemoryRepository::GetAccess(Transaction& t, uint64_t asset_id, const std::string& principal) {
  const auto& s  = TX(t).View();
  const auto  it = s.access.find(AccessKey(asset_id, principal));
  if (it == s.access.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace registry::db::memory
