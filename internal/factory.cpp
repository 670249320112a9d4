#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace registry::factory {

using registry::observability::BoolField;
using registry::observability::StringField;
using registry::runtime::config::DatabaseConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const DatabaseConfig& database) {
  switch (database.backend_case()) {
    case DatabaseConfig::kMemory:
      REGISTRY_LOG_INFO("Using in-memory repository");
      return std::make_shared<db::memory::MemoryRepository>();

    case DatabaseConfig::kSqlite: {
      const auto& sqlite = database.sqlite();
      auto        handle = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
      db::sqlite::BootstrapSchema(*handle);
      REGISTRY_LOG_INFO("Using sqlite repository", {StringField("path", sqlite.path()), BoolField("wal_mode", sqlite.wal_mode())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(handle));
    }

    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::runtime_error("database backend is not configured");
}

} // namespace

Application Build(const registry::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config.database());

  app.registry = std::make_shared<core::AssetRegistry>(app.repository);
  app.registry->Initialize(config.registry().administrator());

  service::ServiceContext ctx;
  ctx.registry = app.registry;
  app.registry_service = std::make_shared<service::RegistryService>(std::move(ctx));
  return app;
}

} // namespace registry::factory
