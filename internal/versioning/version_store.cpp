#include "version_store.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/versioning/metadata.hpp"

namespace artifact::versioning {

using artifact::manager::v1::ArtifactVersion;
using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

void ThrowIfDbError(const artifact::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const std::string code = artifact::db::ErrorCodeName(result.code);
  throw std::runtime_error(result.message.empty() ? context + " (" + code + ")" : context + " (" + code + "): " + result.message);
}

} // namespace

VersionStore::VersionStore(std::shared_ptr<artifact::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("version store: repository is required");
  }
}

ArtifactVersion VersionStore::ToProto(const artifact::db::model::VersionRecord& record) {
  ArtifactVersion version;
  version.set_artifact_id(record.artifact_id);
  version.set_artifact_type(record.artifact_type);
  version.set_version(record.version);
  version.set_content(record.content);
  *version.mutable_created_at() = util::MicrosToProto(record.created_at_us);
  version.set_is_current(record.is_current);
  *version.mutable_metadata() = ParseMetadata(record.metadata_json);
  return version;
}

std::shared_mutex& VersionStore::ArtifactShard(const std::string& artifact_id) {
  return artifact_mu_[std::hash<std::string>{}(artifact_id) % kArtifactLockShardCount];
}

void VersionStore::CacheLatest(const std::string& artifact_id, uint32_t version) {
  std::lock_guard<std::mutex> lock(latest_mutex_);
  if (version == 0) {
    latest_.erase(artifact_id);
    return;
  }
  latest_[artifact_id] = version;
}

uint32_t VersionStore::LatestVersion(const std::string& artifact_id) const {
  std::lock_guard<std::mutex> lock(latest_mutex_);
  auto                        it = latest_.find(artifact_id);
  return it == latest_.end() ? 0 : it->second;
}

void VersionStore::Hydrate() {
  auto       tx    = repository_->Begin();
  const auto heads = repository_->ListHeads(*tx);
  tx->Commit();

  std::unordered_map<std::string, uint32_t> latest;
  for (const auto& head : heads) {
    latest[head.artifact_id] = head.latest_version;
  }

  {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    latest_ = std::move(latest);
  }
  ARTIFACT_LOG_INFO("Version store hydrated", {IntField("artifacts", static_cast<int64_t>(heads.size()))});
}

ArtifactVersion VersionStore::Append(const std::string& artifact_id, const std::string& artifact_type, const std::string& content,
                                     const google::protobuf::Struct& metadata) {
  artifact::observability::SpanScope span("VersionStore.Append");
  span.SetAttribute("artifact.id", artifact_id);

  std::unique_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  artifact::db::model::VersionRecord record;
  try {
    auto       tx      = repository_->Begin();
    const auto current = repository_->GetCurrentVersion(*tx, artifact_id);

    uint32_t latest = LatestVersion(artifact_id);
    if (current) {
      latest = std::max(latest, current->version);
    }

    record.artifact_id   = artifact_id;
    record.artifact_type = artifact_type;
    record.version       = latest + 1;
    record.content       = content;
    record.created_at_us = util::ToUnixMicros(util::Now());
    if (current) {
      record.created_at_us = std::max(record.created_at_us, current->created_at_us);
    }
    record.is_current    = true;
    record.metadata_json = SerializeMetadata(metadata);

    ThrowIfDbError(repository_->ClearCurrent(*tx, artifact_id), "clear current version");
    ThrowIfDbError(repository_->InsertVersion(*tx, record), "insert version");
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    artifact::observability::Metrics::Instance().RecordVersionAppend(false);
    ARTIFACT_LOG_ERROR("Version append failed", {StringField("artifact_id", artifact_id), StringField("error", e.what())});
    throw util::StoreUnavailable("append version to '" + artifact_id + "': " + e.what());
  }

  CacheLatest(artifact_id, record.version);
  artifact::observability::Metrics::Instance().RecordVersionAppend(true);
  span.SetAttribute("artifact.version", static_cast<int64_t>(record.version));
  return ToProto(record);
}

std::optional<ArtifactVersion> VersionStore::GetCurrent(const std::string& artifact_id) {
  std::shared_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  auto tx = repository_->Begin();
  std::optional<artifact::db::model::VersionRecord> record;

  // Cached head is a primary-key lookup; fall back to the current flag.
  if (const auto latest = LatestVersion(artifact_id); latest > 0) {
    record = repository_->GetVersion(*tx, artifact_id, latest);
  }
  if (!record || !record->is_current) {
    record = repository_->GetCurrentVersion(*tx, artifact_id);
  }
  tx->Commit();

  if (!record) return std::nullopt;
  return ToProto(*record);
}

std::optional<ArtifactVersion> VersionStore::GetVersion(const std::string& artifact_id, uint32_t version) {
  std::shared_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  auto tx     = repository_->Begin();
  auto record = repository_->GetVersion(*tx, artifact_id, version);
  tx->Commit();

  if (!record) return std::nullopt;
  return ToProto(*record);
}

std::vector<artifact::db::model::VersionRecord> VersionStore::ListRecords(const std::string& artifact_id) {
  std::shared_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  auto tx      = repository_->Begin();
  auto records = repository_->ListVersions(*tx, artifact_id);
  tx->Commit();

  std::sort(records.begin(), records.end(),
            [](const artifact::db::model::VersionRecord& a, const artifact::db::model::VersionRecord& b) { return a.version < b.version; });
  return records;
}

std::vector<ArtifactVersion> VersionStore::ListVersions(const std::string& artifact_id) {
  const auto records = ListRecords(artifact_id);

  std::vector<ArtifactVersion> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToProto(record));
  }
  return out;
}

std::vector<artifact::db::model::ArtifactHead> VersionStore::ListHeads() {
  auto tx    = repository_->Begin();
  auto heads = repository_->ListHeads(*tx);
  tx->Commit();
  return heads;
}

std::vector<std::string> VersionStore::ListArtifactIds() {
  std::vector<std::string> ids;
  for (auto& head : ListHeads()) {
    ids.push_back(std::move(head.artifact_id));
  }
  return ids;
}

bool VersionStore::ImportHistory(const std::string& artifact_id, const std::vector<artifact::db::model::VersionRecord>& history) {
  std::unique_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  uint32_t latest = 0;
  try {
    auto tx = repository_->Begin();
    if (!repository_->ListVersions(*tx, artifact_id).empty()) {
      tx->Rollback();
      return false;
    }

    for (const auto& record : history) {
      ThrowIfDbError(repository_->InsertVersion(*tx, record), "import version");
      latest = std::max(latest, record.version);
    }
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StoreUnavailable("import history for '" + artifact_id + "': " + e.what());
  }

  CacheLatest(artifact_id, latest);
  return true;
}

void VersionStore::Drop(const std::string& artifact_id) {
  std::unique_lock<std::shared_mutex> artifact_lock(ArtifactShard(artifact_id));

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteArtifact(*tx, artifact_id), "delete artifact");
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StoreUnavailable("drop '" + artifact_id + "': " + e.what());
  }

  CacheLatest(artifact_id, 0);
}

} // namespace artifact::versioning
