#pragma once

#include "sqlite_db.hpp"

namespace artifact::db::sqlite {

// Creates the artifact_version table and its indexes when missing.
void BootstrapSchema(SqliteDB& db);

} // namespace artifact::db::sqlite
