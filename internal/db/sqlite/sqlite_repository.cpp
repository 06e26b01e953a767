#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace artifact::db::sqlite {

using artifact::db::ErrorCode;
using artifact::db::Result;

namespace {

constexpr const char* kVersionColumns = "artifact_id,artifact_type,version,content,created_at_us,is_current,metadata";

// Finalizes the statement when the scope ends.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(bytes)) : std::string();
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

void PrepareOrThrow(sqlite3* db, const std::string& sql, Statement& stmt) {
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
}

model::VersionRecord ReadVersion(sqlite3_stmt* st) {
  model::VersionRecord r;
  r.artifact_id   = ColText(st, 0);
  r.artifact_type = ColText(st, 1);
  r.version       = static_cast<uint32_t>(ColI64(st, 2));
  r.content       = ColBlob(st, 3);
  r.created_at_us = ColI64(st, 4);
  r.is_current    = ColI64(st, 5) != 0;
  r.metadata_json = ColText(st, 6);
  if (r.metadata_json.empty()) r.metadata_json = "{}";
  return r;
}

std::vector<model::VersionRecord> StepAll(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::VersionRecord> out;
  int                               rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadVersion(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO artifact_version(") + kVersionColumns + ") VALUES(?,?,?,?,?,?,?);";

  Statement stmt;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, r.artifact_id);
  BindText(stmt.st, 2, r.artifact_type);
  BindI64(stmt.st, 3, r.version);
  BindBlob(stmt.st, 4, r.content);
  BindI64(stmt.st, 5, r.created_at_us);
  BindI64(stmt.st, 6, r.is_current ? 1 : 0);
  BindText(stmt.st, 7, r.metadata_json);

  return Translate(db, sqlite3_step(stmt.st));
}

Result SqliteRepository::ClearCurrent(Transaction& t, const std::string& artifact_id) {
  auto* db = TX(t).Handle();

  Statement stmt;
  if (sqlite3_prepare_v2(db, "UPDATE artifact_version SET is_current=0 WHERE artifact_id=? AND is_current=1;", -1, &stmt.st, nullptr) !=
      SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, artifact_id);
  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::VersionRecord> SqliteRepository::GetVersion(Transaction& t, const std::string& artifact_id, uint32_t version) {
  auto* db = TX(t).Handle();

  Statement stmt;
  PrepareOrThrow(db, std::string("SELECT ") + kVersionColumns + " FROM artifact_version WHERE artifact_id=? AND version=?;", stmt);
  BindText(stmt.st, 1, artifact_id);
  BindI64(stmt.st, 2, version);

  auto rows = StepAll(db, stmt.st);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::VersionRecord> SqliteRepository::GetCurrentVersion(Transaction& t, const std::string& artifact_id) {
  auto* db = TX(t).Handle();

  Statement stmt;
  PrepareOrThrow(db, std::string("SELECT ") + kVersionColumns + " FROM artifact_version WHERE artifact_id=? AND is_current=1;", stmt);
  BindText(stmt.st, 1, artifact_id);

  auto rows = StepAll(db, stmt.st);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::VersionRecord> SqliteRepository::ListVersions(Transaction& t, const std::string& artifact_id) {
  auto* db = TX(t).Handle();

  Statement stmt;
  PrepareOrThrow(db, std::string("SELECT ") + kVersionColumns + " FROM artifact_version WHERE artifact_id=? ORDER BY version ASC;", stmt);
  BindText(stmt.st, 1, artifact_id);

  return StepAll(db, stmt.st);
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

std::vector<model::ArtifactHead> SqliteRepository::ListHeads(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement stmt;
  PrepareOrThrow(db, "SELECT artifact_id, MAX(version), COUNT(*) FROM artifact_version GROUP BY artifact_id ORDER BY artifact_id ASC;", stmt);

  std::vector<model::ArtifactHead> out;
  int                              rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
    model::ArtifactHead head;
    head.artifact_id    = ColText(stmt.st, 0);
    head.latest_version = static_cast<uint32_t>(ColI64(stmt.st, 1));
    head.version_count  = static_cast<uint64_t>(ColI64(stmt.st, 2));
    out.push_back(std::move(head));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::DeleteArtifact(Transaction& t, const std::string& artifact_id) {
  auto* db = TX(t).Handle();

  Statement stmt;
  if (sqlite3_prepare_v2(db, "DELETE FROM artifact_version WHERE artifact_id=?;", -1, &stmt.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(stmt.st, 1, artifact_id);
  return Translate(db, sqlite3_step(stmt.st));
}

} // namespace artifact::db::sqlite
