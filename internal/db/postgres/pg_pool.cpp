#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"

namespace artifact::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_version",
               "INSERT INTO artifact_version(artifact_id,artifact_type,version,content,created_at_us,is_current,metadata) "
               "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb)");

  conn.prepare("clear_current", "UPDATE artifact_version SET is_current=false WHERE artifact_id=$1 AND is_current");

  conn.prepare("get_version",
               "SELECT artifact_id,artifact_type,version,content,created_at_us,is_current,metadata::text "
               "FROM artifact_version WHERE artifact_id=$1 AND version=$2");

  conn.prepare("get_current_version",
               "SELECT artifact_id,artifact_type,version,content,created_at_us,is_current,metadata::text "
               "FROM artifact_version WHERE artifact_id=$1 AND is_current");

  conn.prepare("list_versions",
               "SELECT artifact_id,artifact_type,version,content,created_at_us,is_current,metadata::text "
               "FROM artifact_version WHERE artifact_id=$1 ORDER BY version ASC");

  conn.prepare("list_heads", "SELECT artifact_id, MAX(version), COUNT(*) FROM artifact_version GROUP BY artifact_id ORDER BY artifact_id ASC");

  conn.prepare("delete_artifact", "DELETE FROM artifact_version WHERE artifact_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  const bool                        reusable = owned->is_open();
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  if (!reusable) {
    ARTIFACT_LOG_WARN("Dropping closed postgres connection");
  }
  cv_.notify_one();
}

} // namespace artifact::db::postgres
