#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace artifact::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertVersion(Transaction&, const model::VersionRecord&) override;
  Result ClearCurrent(Transaction&, const std::string& artifact_id) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& artifact_id, uint32_t version) override;
  std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, const std::string& artifact_id) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& artifact_id) override;

  std::vector<model::ArtifactHead> ListHeads(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& artifact_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace artifact::db::sqlite
