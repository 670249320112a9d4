#pragma once

#include <memory>

namespace registry::core { class AssetRegistry; }

namespace registry::service {

/*
  Dependency container shared by services.
*/
struct ServiceContext {
  std::shared_ptr<registry::core::AssetRegistry> registry;
};

}
