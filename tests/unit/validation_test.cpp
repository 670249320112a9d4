#include "internal/core/validation.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using registry::core::AssetFields;
using registry::core::ValidateAssetFields;
using registry::core::ValidatePrincipal;
using registry::util::ErrorKind;
using registry::util::RegistryError;

AssetFields Valid() {
  AssetFields fields;
  fields.name        = "doc";
  fields.size_bytes  = 100;
  fields.description = "x";
  fields.tags        = {"a"};
  return fields;
}

// Returns the kind ValidateAssetFields raised, or nothing for a pass.
std::optional<ErrorKind> KindOf(const AssetFields& fields) {
  try {
    ValidateAssetFields(fields);
  } catch (const RegistryError& ex) {
    return ex.Kind();
  }
  return std::nullopt;
}

void TestValidFieldsPass() {
  assert(!KindOf(Valid()).has_value());
}

void TestFirstViolationWins() {
  auto fields       = Valid();
  fields.name       = "";
  fields.size_bytes = 0;
  fields.tags       = {};
  assert(KindOf(fields) == ErrorKind::InvalidParameters);

  fields            = Valid();
  fields.size_bytes = 0;
  fields.tags       = {};
  assert(KindOf(fields) == ErrorKind::CapacityExceeded);

  fields             = Valid();
  fields.description = std::string(129, 'd');
  fields.tags        = {};
  assert(KindOf(fields) == ErrorKind::InvalidParameters);
}

void TestLengthsAreBytes() {
  // "é" is two bytes in UTF-8.
  std::string name;
  for (int i = 0; i < 32; ++i) name += "\xc3\xa9";

  auto fields = Valid();
  fields.name = name;
  assert(!KindOf(fields).has_value());

  fields.name += "\xc3\xa9";
  assert(KindOf(fields) == ErrorKind::InvalidParameters);
}

void TestTagShape() {
  auto fields = Valid();

  fields.tags = std::vector<std::string>(10, std::string(32, 't'));
  assert(!KindOf(fields).has_value());

  fields.tags.push_back("t");
  assert(KindOf(fields) == ErrorKind::FormatValidation);

  fields.tags = {"a", std::string(33, 't'), "c"};
  assert(KindOf(fields) == ErrorKind::FormatValidation);

  fields.tags = {"a", ""};
  assert(KindOf(fields) == ErrorKind::FormatValidation);
}

void TestPrincipal() {
  ValidatePrincipal("alice", "caller");

  bool threw = false;
  try {
    ValidatePrincipal("", "new owner");
  } catch (const registry::util::InvalidParameters&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestValidFieldsPass();
  TestFirstViolationWins();
  TestLengthsAreBytes();
  TestTagShape();
  TestPrincipal();

  std::cout << "asset_registry_unit_validation: pass\n";
  return 0;
}
