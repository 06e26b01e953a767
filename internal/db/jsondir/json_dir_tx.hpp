#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "json_dir_repository.hpp"

namespace artifact::db::jsondir {

class JsonDirTransaction final : public db::Transaction {
 public:
  explicit JsonDirTransaction(JsonDirRepository& repo);
  ~JsonDirTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::vector<model::VersionRecord>&       Mutable(const std::string& artifact_id);
  const std::vector<model::VersionRecord>& View(const std::string& artifact_id);

  // ids with at least one version, as seen by this transaction
  std::vector<std::string> ArtifactIds();

 private:
  struct Entry {
    std::vector<model::VersionRecord> history;
    bool                              dirty = false;
  };

  Entry& Load(const std::string& artifact_id);

  JsonDirRepository&           repo_;
  std::unique_lock<std::mutex> lock_;
  std::map<std::string, Entry> entries_;
  bool                         committed_ = false;
};

} // namespace artifact::db::jsondir
