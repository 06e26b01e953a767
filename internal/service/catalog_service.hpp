#pragma once

#include "artifact/manager/v1.hpp"
#include "service_context.hpp"

namespace artifact::service {

class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  artifact::manager::v1::GetArtifactResponse GetArtifact(const artifact::manager::v1::GetArtifactRequest& req);

  artifact::manager::v1::GetVersionResponse GetVersion(const artifact::manager::v1::GetVersionRequest& req);

  artifact::manager::v1::ListVersionsResponse ListVersions(const artifact::manager::v1::ListVersionsRequest& req);

  artifact::manager::v1::ListArtifactsResponse ListArtifacts(const artifact::manager::v1::ListArtifactsRequest& req);

  // appends a new version carrying the old version's content
  artifact::manager::v1::RestoreVersionResponse RestoreVersion(const artifact::manager::v1::RestoreVersionRequest& req);

  artifact::manager::v1::CompareVersionsResponse CompareVersions(const artifact::manager::v1::CompareVersionsRequest& req);

 private:
  artifact::manager::v1::ArtifactVersion RequireVersion(const std::string& artifact_id, uint32_t version);

  ServiceContext ctx_;
};

} // namespace artifact::service
