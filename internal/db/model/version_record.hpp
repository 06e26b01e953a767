#pragma once

#include <cstdint>
#include <string>

namespace artifact::db::model {

struct VersionRecord {
  std::string artifact_id;
  std::string artifact_type;
  uint32_t    version = 0;
  std::string content;
  int64_t     created_at_us = 0;
  bool        is_current    = false;

  // JSON object text; "{}" when there is no metadata
  std::string metadata_json = "{}";
};

// Per-artifact summary used to rebuild the version cache.
struct ArtifactHead {
  std::string artifact_id;
  uint32_t    latest_version = 0;
  uint64_t    version_count  = 0;
};

} // namespace artifact::db::model
