#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace registry::core {

/*
  Raises a failed repository Result as an exception.

  AlreadyExists -> DuplicateEntry, NotFound -> AssetNotFound; every other
  code is a backend fault (std::runtime_error).
*/
void ThrowIfDbError(const registry::db::Result& result, const std::string& context);

} // namespace registry::core
