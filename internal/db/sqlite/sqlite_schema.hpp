#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace millsync::db::sqlite {

// Ordered schema migrations; entry i is version i + 1.
const std::vector<std::string>& SchemaMigrations();

// Brings the database up to the latest schema version. Returns the number of
// migrations applied.
int ApplySchema(SqliteDB& db);

} // namespace millsync::db::sqlite
