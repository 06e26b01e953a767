#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace artifact::db::memory {

/*
  Transaction = per-artifact snapshot + write set

  An artifact's history is copied on first access. Commit fails if any
  artifact written here was committed by someone else in the meantime.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::vector<model::VersionRecord>&       Mutable(const std::string& artifact_id);
  const std::vector<model::VersionRecord>& View(const std::string& artifact_id);

  std::vector<model::ArtifactHead> Heads();

 private:
  struct Entry {
    std::vector<model::VersionRecord> history;
    uint64_t                          revision = 0;
    bool                              dirty    = false;
  };

  Entry& Load(const std::string& artifact_id);

  MemoryRepository&                      repo_;
  std::unordered_map<std::string, Entry> entries_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace artifact::db::memory
