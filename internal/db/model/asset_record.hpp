#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace registry::db::model {

/*
  Persistent asset row.

  IMPORTANT:
  - asset_id is assigned by the core from the registry counter, never by
    the backend.
  - created_at is the host sequence number at creation and never changes.
  - tags keep their insertion order.
*/

struct AssetRecord {
  uint64_t asset_id = 0;

  std::string name;
  std::string owner;

  uint64_t size_bytes = 0;
  uint64_t created_at = 0;

  std::string description;

  std::vector<std::string> tags;
};

} // namespace registry::db::model
