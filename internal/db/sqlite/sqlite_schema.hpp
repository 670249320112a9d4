#pragma once

#include "sqlite_db.hpp"

namespace registry::db::sqlite {

/*
  Creates the registry tables if missing and probes their columns.

  Idempotent: safe to run on every open of an existing ledger.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace registry::db::sqlite
