#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace artifact::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  auto& history = TX(t).Mutable(r.artifact_id);
  auto  pos     = std::lower_bound(history.begin(), history.end(), r.version,
                                   [](const model::VersionRecord& existing, uint32_t version) { return existing.version < version; });
  if (pos != history.end() && pos->version == r.version) {
    return Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version) + " of '" + r.artifact_id + "' already exists");
  }
  history.insert(pos, r);
  return Result::Ok();
}

Result MemoryRepository::ClearCurrent(Transaction& t, const std::string& artifact_id) {
  for (auto& record : TX(t).Mutable(artifact_id)) {
    record.is_current = false;
  }
  return Result::Ok();
}

std::optional<model::VersionRecord> MemoryRepository::GetVersion(Transaction& t, const std::string& artifact_id, uint32_t version) {
  for (const auto& record : TX(t).View(artifact_id)) {
    if (record.version == version) return record;
  }
  return std::nullopt;
}

std::optional<model::VersionRecord> MemoryRepository::GetCurrentVersion(Transaction& t, const std::string& artifact_id) {
  for (const auto& record : TX(t).View(artifact_id)) {
    if (record.is_current) return record;
  }
  return std::nullopt;
}

std::vector<model::VersionRecord> MemoryRepository::ListVersions(Transaction& t, const std::string& artifact_id) {
  return TX(t).View(artifact_id);
}

std::vector<model::ArtifactHead> MemoryRepository::ListHeads(Transaction& t) {
  return TX(t).Heads();
}

Result MemoryRepository::DeleteArtifact(Transaction& t, const std::string& artifact_id) {
  TX(t).Mutable(artifact_id).clear();
  return Result::Ok();
}

} // namespace artifact::db::memory
