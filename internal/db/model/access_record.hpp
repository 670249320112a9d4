#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

/*
  One access-control-list row, keyed by (asset_id, principal).

  A missing row means no grant. Rows outlive the asset they refer to.
*/

struct AccessRecord {
  uint64_t    asset_id = 0;
  std::string principal;
  bool        read_enabled = false;
};

} // namespace registry::db::model
