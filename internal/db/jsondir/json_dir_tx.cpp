#include "json_dir_tx.hpp"

#include <set>

namespace artifact::db::jsondir {

JsonDirTransaction::JsonDirTransaction(JsonDirRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

JsonDirTransaction::Entry& JsonDirTransaction::Load(const std::string& artifact_id) {
  auto it = entries_.find(artifact_id);
  if (it != entries_.end()) return it->second;

  Entry entry;
  if (auto history = repo_.ReadFile(artifact_id)) {
    entry.history = std::move(*history);
  }
  return entries_.emplace(artifact_id, std::move(entry)).first->second;
}

std::vector<model::VersionRecord>& JsonDirTransaction::Mutable(const std::string& artifact_id) {
  auto& entry = Load(artifact_id);
  entry.dirty = true;
  return entry.history;
}

const std::vector<model::VersionRecord>& JsonDirTransaction::View(const std::string& artifact_id) {
  return Load(artifact_id).history;
}

std::vector<std::string> JsonDirTransaction::ArtifactIds() {
  std::set<std::string> ids;
  for (auto& id : repo_.ListFileIds()) {
    ids.insert(std::move(id));
  }
  for (const auto& [id, entry] : entries_) {
    if (entry.history.empty()) {
      ids.erase(id);
    } else {
      ids.insert(id);
    }
  }
  return {ids.begin(), ids.end()};
}

void JsonDirTransaction::Commit() {
  // new content is published before anything is removed
  for (const auto& [id, entry] : entries_) {
    if (entry.dirty && !entry.history.empty()) repo_.WriteFile(id, entry.history);
  }
  for (const auto& [id, entry] : entries_) {
    if (entry.dirty && entry.history.empty()) repo_.RemoveFile(id);
  }
  committed_ = true;
  entries_.clear();
  if (lock_.owns_lock()) lock_.unlock();
}

void JsonDirTransaction::Rollback() {
  entries_.clear();
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace artifact::db::jsondir
