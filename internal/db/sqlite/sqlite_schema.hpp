#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace rulebook::db::sqlite {

// Creates tables/indexes if missing, then checks every column the repository reads.
void BootstrapSqliteSchema(SqliteDB& db);

} // namespace rulebook::db::sqlite
