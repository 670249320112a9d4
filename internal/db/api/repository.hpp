#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/access_record.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/registry_state_record.hpp"

namespace registry::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Nothing becomes visible unless the transaction commits

  The repository stores rows; it does not validate them. Ownership,
  field bounds and id assignment belong to the core.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Registry state (id counter + administrator)
  // ---------------------------------------------------------------------

  // nullopt until the registry has been initialized once.
  virtual std::optional<model::RegistryStateRecord> GetRegistryState(Transaction&) = 0;

  virtual Result PutRegistryState(Transaction&, const model::RegistryStateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  // AlreadyExists if the id is taken.
  virtual Result InsertAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> GetAsset(Transaction&, uint64_t asset_id) = 0;

  // NotFound if the id is absent.
  virtual Result UpdateAsset(Transaction&, const model::AssetRecord&) = 0;

  // NotFound if the id is absent. Access rows are left untouched.
  virtual Result DeleteAsset(Transaction&, uint64_t asset_id) = 0;

  // ---------------------------------------------------------------------
  // Access control list
  // ---------------------------------------------------------------------

  virtual Result UpsertAccess(Transaction&, const model::AccessRecord&) = 0;

  virtual std::optional<model::AccessRecord> GetAccess(Transaction&, uint64_t asset_id, const std::string& principal) = 0;
};

} // namespace registry::db
