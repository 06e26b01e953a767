#include "pg_repository.hpp"

namespace artifact::db::postgres {

namespace {

model::VersionRecord ReadVersion(const pqxx::row& row) {
  model::VersionRecord r;
  r.artifact_id   = row[0].c_str();
  r.artifact_type = row[1].c_str();
  r.version       = row[2].as<uint32_t>();
  r.content       = pqxx::binarystring(row[3]).str();
  r.created_at_us = row[4].as<int64_t>();
  r.is_current    = row[5].as<bool>();
  r.metadata_json = row[6].is_null() ? "{}" : row[6].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_version", r.artifact_id, r.artifact_type, r.version,
                               pqxx::binarystring(r.content.data(), r.content.size()), r.created_at_us, r.is_current, r.metadata_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ClearCurrent(Transaction& t, const std::string& artifact_id) {
  try {
    TX(t).Work().exec_prepared("clear_current", artifact_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VersionRecord> PgRepository::GetVersion(Transaction& t, const std::string& artifact_id, uint32_t version) {
  auto res = TX(t).Work().exec_prepared("get_version", artifact_id, version);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::optional<model::VersionRecord> PgRepository::GetCurrentVersion(Transaction& t, const std::string& artifact_id) {
  auto res = TX(t).Work().exec_prepared("get_current_version", artifact_id);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::vector<model::VersionRecord> PgRepository::ListVersions(Transaction& t, const std::string& artifact_id) {
  auto res = TX(t).Work().exec_prepared("list_versions", artifact_id);

  std::vector<model::VersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

std::vector<model::ArtifactHead> PgRepository::ListHeads(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_heads");

  std::vector<model::ArtifactHead> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ArtifactHead head;
    head.artifact_id    = row[0].c_str();
    head.latest_version = row[1].as<uint32_t>();
    head.version_count  = row[2].as<uint64_t>();
    out.push_back(std::move(head));
  }
  return out;
}

Result PgRepository::DeleteArtifact(Transaction& t, const std::string& artifact_id) {
  try {
    TX(t).Work().exec_prepared("delete_artifact", artifact_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS artifact_version (artifact_id TEXT NOT NULL, artifact_type TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, "
          "content BYTEA NOT NULL, created_at_us BIGINT NOT NULL, is_current BOOLEAN NOT NULL DEFAULT false, metadata JSONB NOT NULL DEFAULT '{}', "
          "PRIMARY KEY (artifact_id, version));");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS artifact_version_current ON artifact_version(artifact_id) WHERE is_current;");
  tx.exec("CREATE TABLE IF NOT EXISTS artifact_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO artifact_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;");

  tx.exec("SELECT artifact_id,artifact_type,version,content,created_at_us,is_current,metadata FROM artifact_version LIMIT 1;");
  tx.commit();
}

} // namespace artifact::db::postgres
