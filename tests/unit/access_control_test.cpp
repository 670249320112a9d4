#include "internal/access/access_control.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using registry::access::AccessControl;
using registry::db::memory::MemoryRepository;
using registry::db::model::AccessRecord;
using registry::db::model::AssetRecord;

AssetRecord MakeAsset(uint64_t asset_id, const std::string& owner) {
  AssetRecord asset;
  asset.asset_id    = asset_id;
  asset.name        = "doc";
  asset.owner       = owner;
  asset.size_bytes  = 1;
  asset.description = "d";
  asset.tags        = {"t"};
  return asset;
}

void TestMissingEntryDeniesNonOwner() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccessControl access(repo);
  auto          tx    = repo->Begin();
  const auto    asset = MakeAsset(1, "alice");

  assert(!access.HasGrant(*tx, 1, "bob"));

  const auto status = access.Status(*tx, asset, "bob");
  assert(!status.has_granted_access());
  assert(!status.is_asset_owner());
  assert(!status.can_read_asset());

  bool threw = false;
  try {
    access.RequireReadable(*tx, asset, "bob");
  } catch (const registry::util::ContentRestricted&) {
    threw = true;
  }
  assert(threw);
}

void TestOwnerReadsWithoutEntry() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccessControl access(repo);
  auto          tx    = repo->Begin();
  const auto    asset = MakeAsset(1, "alice");

  const auto status = access.Status(*tx, asset, "alice");
  assert(!status.has_granted_access());
  assert(status.is_asset_owner());
  assert(status.can_read_asset());

  access.RequireReadable(*tx, asset, "alice");
}

void TestCreatorGrantIsExplicit() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccessControl access(repo);

  {
    auto tx = repo->Begin();
    access.GrantCreator(*tx, 5, "carol");
    tx->Commit();
  }

  auto       tx    = repo->Begin();
  const auto entry = repo->GetAccess(*tx, 5, "carol");
  assert(entry.has_value());
  assert(entry->read_enabled);

  // Owned by someone else now, carol still reads through the grant.
  const auto asset = MakeAsset(5, "dave");
  access.RequireReadable(*tx, asset, "carol");
  assert(access.Status(*tx, asset, "carol").can_read_asset());

  // Grants are per asset.
  assert(!access.HasGrant(*tx, 6, "carol"));
}

void TestDisabledEntryIsNotAGrant() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccessControl access(repo);
  auto          tx = repo->Begin();

  AccessRecord entry;
  entry.asset_id     = 3;
  entry.principal    = "erin";
  entry.read_enabled = false;
  assert(repo->UpsertAccess(*tx, entry));

  assert(!access.HasGrant(*tx, 3, "erin"));
  assert(!access.Status(*tx, MakeAsset(3, "alice"), "erin").can_read_asset());
}

} // namespace

int main() {
  TestMissingEntryDeniesNonOwner();
  TestOwnerReadsWithoutEntry();
  TestCreatorGrantIsExplicit();
  TestDisabledEntryIsNotAGrant();

  std::cout << "asset_registry_unit_access_control: pass\n";
  return 0;
}
