#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artifact::db::memory {

class MemoryTransaction;

/*
  Process-local repository, used by tests and by deployments that do not
  need history to survive a restart.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertVersion(Transaction&, const model::VersionRecord&) override;
  Result ClearCurrent(Transaction&, const std::string& artifact_id) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& artifact_id, uint32_t version) override;
  std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, const std::string& artifact_id) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& artifact_id) override;

  std::vector<model::ArtifactHead> ListHeads(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& artifact_id) override;

private:
  friend class MemoryTransaction;

  using History = std::vector<model::VersionRecord>;

  std::mutex mutex_;
  std::map<std::string, History> committed_;
  // bumped on every committed write to an artifact
  std::unordered_map<std::string, uint64_t> revisions_;
};

} // namespace artifact::db::memory
