#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/asset_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/registry_service.hpp"

namespace registry::factory {

/*
  Application

  Owns the long-lived objects of one registry instance.
*/
struct Application {
  std::shared_ptr<registry::db::Repository> repository;
  std::shared_ptr<registry::core::AssetRegistry> registry;
  std::shared_ptr<registry::service::RegistryService> registry_service;
};

/*
  Build

  Constructs the repository selected by config, bootstraps its schema,
  initializes the registry with the configured administrator and wires the
  service layer.

  NOTE:
  This is the composition root. It is the ONLY place that knows concrete
  repository types.
*/
Application Build(const registry::runtime::config::RuntimeConfig& config);

}
