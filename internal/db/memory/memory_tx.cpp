#include "memory_tx.hpp"

#include <map>
#include <stdexcept>

namespace artifact::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryTransaction::Entry& MemoryTransaction::Load(const std::string& artifact_id) {
  auto it = entries_.find(artifact_id);
  if (it != entries_.end()) return it->second;

  Entry entry;
  {
    std::scoped_lock lock(repo_.mutex_);
    auto             committed = repo_.committed_.find(artifact_id);
    if (committed != repo_.committed_.end()) {
      entry.history = committed->second; // snapshot copy
    }
    auto revision = repo_.revisions_.find(artifact_id);
    if (revision != repo_.revisions_.end()) {
      entry.revision = revision->second;
    }
  }
  return entries_.emplace(artifact_id, std::move(entry)).first->second;
}

std::vector<model::VersionRecord>& MemoryTransaction::Mutable(const std::string& artifact_id) {
  auto& entry = Load(artifact_id);
  entry.dirty = true;
  return entry.history;
}

const std::vector<model::VersionRecord>& MemoryTransaction::View(const std::string& artifact_id) {
  return Load(artifact_id).history;
}

std::vector<model::ArtifactHead> MemoryTransaction::Heads() {
  std::map<std::string, model::ArtifactHead> heads;

  auto summarize = [](const std::string& id, const std::vector<model::VersionRecord>& history) {
    model::ArtifactHead head;
    head.artifact_id   = id;
    head.version_count = history.size();
    for (const auto& record : history) {
      if (record.version > head.latest_version) head.latest_version = record.version;
    }
    return head;
  };

  {
    std::scoped_lock lock(repo_.mutex_);
    for (const auto& [id, history] : repo_.committed_) {
      if (!entries_.contains(id) && !history.empty()) heads[id] = summarize(id, history);
    }
  }
  for (const auto& [id, entry] : entries_) {
    if (!entry.history.empty()) heads[id] = summarize(id, entry.history);
  }

  std::vector<model::ArtifactHead> out;
  out.reserve(heads.size());
  for (auto& [_, head] : heads) out.push_back(std::move(head));
  return out;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [id, entry] : entries_) {
    if (!entry.dirty) continue;
    if (repo_.revisions_[id] != entry.revision) {
      throw std::runtime_error("transaction conflict: artifact '" + id + "' was modified by a concurrent transaction");
    }
  }

  for (auto& [id, entry] : entries_) {
    if (!entry.dirty) continue;
    if (entry.history.empty()) {
      repo_.committed_.erase(id);
    } else {
      repo_.committed_[id] = std::move(entry.history);
    }
    repo_.revisions_[id]++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  entries_.clear();
  rolled_back_ = true;
}

} // namespace artifact::db::memory
