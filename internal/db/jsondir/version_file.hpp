#pragma once

#include <string>
#include <vector>

#include "internal/db/model/version_record.hpp"

namespace artifact::db::jsondir {

/*
  On-disk format of one artifact: a JSON array of version objects

    [{"version": 1, "artifact_id": "...", "artifact_type": "...",
      "content": "...", "metadata": {...},
      "created_at": "2023-01-01T00:00:00.000000", "is_current": true}]

  Decoding is lenient about missing fields so that files written by older
  deployments load; artifact_id falls back to the file's own id.
*/

// throws std::runtime_error on malformed JSON
std::vector<model::VersionRecord> DecodeVersionFile(const std::string& file_artifact_id, const std::string& text);

std::string EncodeVersionFile(const std::vector<model::VersionRecord>& records);

} // namespace artifact::db::jsondir
