#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace vaultd::db::sqlite {

/*
  Creates the daemon tables and, when the web application has not yet
  created them, the notes tables it shares with the daemon.
  Idempotent.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace vaultd::db::sqlite
