#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/version_record.hpp"

namespace artifact::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - ClearCurrent + InsertVersion in one transaction become visible together
  - (artifact_id, version) is unique; a duplicate insert fails

  The repository stores records as given. Numbering and the single
  current-version rule are enforced by the version store above it.

  Read failures of the backing medium throw; absence is std::nullopt.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, const model::VersionRecord&) = 0;

  // sets is_current=false on every version of the artifact
  virtual Result ClearCurrent(Transaction&, const std::string& artifact_id) = 0;

  virtual std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& artifact_id, uint32_t version) = 0;

  virtual std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, const std::string& artifact_id) = 0;

  // ascending by version
  virtual std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& artifact_id) = 0;

  // ---------------------------------------------------------------------
  // Artifacts
  // ---------------------------------------------------------------------

  // one entry per artifact with at least one version, sorted by artifact_id
  virtual std::vector<model::ArtifactHead> ListHeads(Transaction&) = 0;

  // removes every version of the artifact; deleting a missing artifact is OK
  virtual Result DeleteArtifact(Transaction&, const std::string& artifact_id) = 0;
};

} // namespace artifact::db
