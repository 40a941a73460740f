#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace trajectory::db::sqlite {

constexpr int kSchemaVersion = 1;

// Creates tables and indexes if missing, then records kSchemaVersion.
// Throws std::runtime_error when the file was written by a newer schema.
void BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace trajectory::db::sqlite
