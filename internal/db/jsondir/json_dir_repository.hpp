#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artifact::db::jsondir {

class JsonDirTransaction;

/*
  File-per-artifact repository.

  Each artifact lives in <root>/<artifact_id>.json. A transaction buffers
  its writes and publishes each touched file by writing a temp file and
  renaming it over the old one, so a reader sees either the old or the new
  history of an artifact. Transactions are serialized on the repository.
*/
class JsonDirRepository final : public db::Repository {
public:
  explicit JsonDirRepository(std::filesystem::path root);

  const std::filesystem::path& Root() const { return root_; }

  std::unique_ptr<Transaction> Begin() override;

  Result InsertVersion(Transaction&, const model::VersionRecord&) override;
  Result ClearCurrent(Transaction&, const std::string& artifact_id) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& artifact_id, uint32_t version) override;
  std::optional<model::VersionRecord> GetCurrentVersion(Transaction&, const std::string& artifact_id) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& artifact_id) override;

  std::vector<model::ArtifactHead> ListHeads(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& artifact_id) override;

  // artifact ids become file names; path separators and dot-prefixed ids are refused
  static bool IsStorableId(const std::string& artifact_id);

private:
  friend class JsonDirTransaction;

  std::filesystem::path PathFor(const std::string& artifact_id) const;
  std::optional<std::vector<model::VersionRecord>> ReadFile(const std::string& artifact_id) const;
  void WriteFile(const std::string& artifact_id, const std::vector<model::VersionRecord>& records) const;
  void RemoveFile(const std::string& artifact_id) const;
  std::vector<std::string> ListFileIds() const;

  std::filesystem::path root_;
  std::mutex mutex_;
};

} // namespace artifact::db::jsondir
