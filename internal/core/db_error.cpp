#include "db_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace registry::core {

void ThrowIfDbError(const registry::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case registry::db::ErrorCode::AlreadyExists:
      throw registry::util::DuplicateEntry(message);
    case registry::db::ErrorCode::NotFound:
      throw registry::util::AssetNotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace registry::core
