#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace artifact::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS artifact_version (artifact_id TEXT NOT NULL, artifact_type TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, "
      "content BLOB NOT NULL, created_at_us INTEGER NOT NULL, is_current INTEGER NOT NULL DEFAULT 0, metadata TEXT NOT NULL DEFAULT '{}', "
      "PRIMARY KEY (artifact_id, version));",
      "CREATE UNIQUE INDEX IF NOT EXISTS artifact_version_current ON artifact_version(artifact_id) WHERE is_current=1;",
      "CREATE TABLE IF NOT EXISTS artifact_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO artifact_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT artifact_id,artifact_type,version,content,created_at_us,is_current,metadata FROM artifact_version LIMIT 1;");
}

} // namespace artifact::db::sqlite
