#pragma once

#include <google/protobuf/struct.pb.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "artifact/manager/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace artifact::versioning {

/*
  Append-only version history per artifact.

  Every artifact_id owns a gapless sequence 1..N; exactly version N is
  current. Append clears the old current flag and inserts the new version
  in one repository transaction.

  Writers of one artifact_id are serialized by a sharded lock which
  readers take shared, so a reader never sees a half-applied append.
  Artifacts only contend when they hash to the same shard, and lookups of
  unknown ids allocate nothing.

  The highest version per artifact is cached in memory and rebuilt from
  the repository by Hydrate().
*/
class VersionStore {
 public:
  explicit VersionStore(std::shared_ptr<artifact::db::Repository> repository);

  void Hydrate();

  // throws util::StoreUnavailable if the write cannot be made durable
  artifact::manager::v1::ArtifactVersion Append(const std::string& artifact_id, const std::string& artifact_type, const std::string& content,
                                                const google::protobuf::Struct& metadata);

  std::optional<artifact::manager::v1::ArtifactVersion> GetCurrent(const std::string& artifact_id);
  std::optional<artifact::manager::v1::ArtifactVersion> GetVersion(const std::string& artifact_id, uint32_t version);
  std::vector<artifact::manager::v1::ArtifactVersion>   ListVersions(const std::string& artifact_id);
  std::vector<artifact::db::model::VersionRecord>       ListRecords(const std::string& artifact_id);
  std::vector<std::string>                              ListArtifactIds();
  std::vector<artifact::db::model::ArtifactHead>        ListHeads();

  // cached highest version, 0 when the artifact has none
  uint32_t LatestVersion(const std::string& artifact_id) const;

  // Installs a full history for an artifact that has no versions yet.
  // Returns false and writes nothing when the artifact already exists.
  bool ImportHistory(const std::string& artifact_id, const std::vector<artifact::db::model::VersionRecord>& history);

  // Removes every version of an artifact.
  void Drop(const std::string& artifact_id);

  static artifact::manager::v1::ArtifactVersion ToProto(const artifact::db::model::VersionRecord& record);

  static constexpr std::size_t kArtifactLockShardCount = 64;

 private:
  std::shared_mutex& ArtifactShard(const std::string& artifact_id);
  void               CacheLatest(const std::string& artifact_id, uint32_t version);

  std::shared_ptr<artifact::db::Repository> repository_;

  mutable std::mutex                        latest_mutex_;
  std::unordered_map<std::string, uint32_t> latest_;

  std::array<std::shared_mutex, kArtifactLockShardCount> artifact_mu_;
};

} // namespace artifact::versioning
