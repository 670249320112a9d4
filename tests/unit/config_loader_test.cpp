#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "asset_registry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& yaml_path) {
  try {
    (void)registry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestSqliteConfigLoads() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\registry\\\"quoted\"\\ledger.db"
    wal_mode: true
registry:
  administrator: registry-admin
)");

  auto config = registry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\registry\\\"quoted\"\\ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.registry().administrator() == "registry-admin");
}

void TestQuotedAdministratorStaysString() {
  const auto yaml_path = WriteYaml("quoted_admin",
                                   R"(database:
  memory: {}
registry:
  administrator: "1001"
)");

  auto config = registry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.registry().administrator() == "1001");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
registry:
  administrator: registry-admin
unknown_field: 123
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingDatabaseIsRejected() {
  const auto yaml_path = WriteYaml("missing_database",
                                   R"(registry:
  administrator: registry-admin
)");

  assert(Rejects(yaml_path));
}

void TestMissingAdministratorIsRejected() {
  const auto yaml_path = WriteYaml("missing_administrator",
                                   R"(database:
  sqlite:
    path: /tmp/ledger.db
)");

  assert(Rejects(yaml_path));
}

void TestEmptySqlitePathIsRejected() {
  const auto yaml_path = WriteYaml("empty_sqlite_path",
                                   R"(database:
  sqlite:
    wal_mode: false
registry:
  administrator: registry-admin
)");

  assert(Rejects(yaml_path));
}

} // namespace

int main() {
  TestSqliteConfigLoads();
  TestQuotedAdministratorStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingDatabaseIsRejected();
  TestMissingAdministratorIsRejected();
  TestEmptySqlitePathIsRejected();

  std::cout << "asset_registry_unit_config_loader: pass\n";
  return 0;
}
