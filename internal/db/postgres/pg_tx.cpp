#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace artifact::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      ARTIFACT_LOG_WARN("postgres rollback failed", {artifact::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("postgres transaction already finished");
  }
  // a failed commit leaves nothing to roll back
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace artifact::db::postgres
