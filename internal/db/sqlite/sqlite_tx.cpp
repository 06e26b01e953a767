#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace artifact::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockConnection()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    ARTIFACT_LOG_WARN("sqlite rollback failed", {artifact::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  // a failed COMMIT leaves the transaction open for the destructor to roll back
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace artifact::db::sqlite
