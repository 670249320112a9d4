#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

// Single registry-wide row.
struct RegistryStateRecord {
  // Last assigned asset id; 0 before the first creation.
  uint64_t last_asset_id = 0;

  // Recorded once at initialization.
  std::string administrator;
};

} // namespace registry::db::model
