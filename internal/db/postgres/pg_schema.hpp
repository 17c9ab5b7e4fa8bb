#pragma once

#include <cstdint>
#include <memory>

#include "pg_pool.hpp"

namespace rulebook::db::postgres {

/*
  Creates the pgvector extension, tables and indexes if missing.
  Embedding columns are vector(<embedding_dimensions>).
*/
void BootstrapPostgresSchema(PgPool& pool, std::uint32_t embedding_dimensions);

} // namespace rulebook::db::postgres
