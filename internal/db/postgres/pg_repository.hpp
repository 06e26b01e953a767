#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace artifact::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertVersion(Transaction&, const model::VersionRecord&) override;
  Result ClearCurrent(Transaction&, const std::string& artifact_id) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& artifact_id, uint32_t version) override;
  std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, const std::string& artifact_id) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& artifact_id) override;

  std::vector<model::ArtifactHead> ListHeads(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& artifact_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

// Creates the artifact_version table and its indexes when missing.
void BootstrapSchema(PgPool& pool);

} // namespace artifact::db::postgres
