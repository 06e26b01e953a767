#include "catalog_service.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/versioning/version_diff.hpp"
#include "internal/versioning/version_store.hpp"
#include "observe_rpc.hpp"

namespace artifact::service {

using namespace artifact::manager::v1;

namespace {

void RequireArtifactId(const std::string& artifact_id) {
  if (artifact_id.empty()) {
    throw util::ValidationError("artifact_id is required");
  }
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ArtifactVersion CatalogService::RequireVersion(const std::string& artifact_id, uint32_t version) {
  auto found = ctx_.store->GetVersion(artifact_id, version);
  if (!found) {
    throw util::NotFound("version " + std::to_string(version) + " of artifact " + artifact_id + " not found");
  }
  return std::move(*found);
}

GetArtifactResponse CatalogService::GetArtifact(const GetArtifactRequest& req) {
  return ObserveRpc("ArtifactCatalogService.GetArtifact", "artifact.id", req.artifact_id(), [&] {
    RequireArtifactId(req.artifact_id());

    auto current = ctx_.store->GetCurrent(req.artifact_id());
    if (!current) {
      throw util::NotFound("artifact not found: " + req.artifact_id());
    }

    GetArtifactResponse resp;
    *resp.mutable_artifact() = std::move(*current);
    return resp;
  });
}

GetVersionResponse CatalogService::GetVersion(const GetVersionRequest& req) {
  return ObserveRpc("ArtifactCatalogService.GetVersion", "artifact.id", req.artifact_id(), [&] {
    RequireArtifactId(req.artifact_id());

    GetVersionResponse resp;
    *resp.mutable_artifact() = RequireVersion(req.artifact_id(), req.version());
    return resp;
  });
}

ListVersionsResponse CatalogService::ListVersions(const ListVersionsRequest& req) {
  return ObserveRpc("ArtifactCatalogService.ListVersions", "artifact.id", req.artifact_id(), [&] {
    RequireArtifactId(req.artifact_id());

    ListVersionsResponse resp;
    for (auto& version : ctx_.store->ListVersions(req.artifact_id())) {
      *resp.add_versions() = std::move(version);
    }
    return resp;
  });
}

ListArtifactsResponse CatalogService::ListArtifacts(const ListArtifactsRequest&) {
  return ObserveRpc("ArtifactCatalogService.ListArtifacts", "", "", [&] {
    ListArtifactsResponse resp;
    for (auto& id : ctx_.store->ListArtifactIds()) {
      resp.add_artifact_ids(std::move(id));
    }
    return resp;
  });
}

RestoreVersionResponse CatalogService::RestoreVersion(const RestoreVersionRequest& req) {
  return ObserveRpc("ArtifactCatalogService.RestoreVersion", "artifact.id", req.artifact_id(), [&] {
    RequireArtifactId(req.artifact_id());

    const auto source = RequireVersion(req.artifact_id(), req.version());

    auto  metadata = source.metadata();
    auto& fields   = *metadata.mutable_fields();
    fields["restored_from"].set_number_value(static_cast<double>(req.version()));
    fields["restored_at"].set_string_value(util::FormatIso8601(util::ToUnixMicros(util::Now())));

    RestoreVersionResponse resp;
    *resp.mutable_artifact() = ctx_.store->Append(source.artifact_id(), source.artifact_type(), source.content(), metadata);
    return resp;
  });
}

CompareVersionsResponse CatalogService::CompareVersions(const CompareVersionsRequest& req) {
  return ObserveRpc("ArtifactCatalogService.CompareVersions", "artifact.id", req.artifact_id(), [&] {
    RequireArtifactId(req.artifact_id());

    const auto a = RequireVersion(req.artifact_id(), req.version_a());
    const auto b = RequireVersion(req.artifact_id(), req.version_b());

    CompareVersionsResponse resp;
    *resp.mutable_comparison() = artifact::versioning::CompareVersions(a, b);
    return resp;
  });
}

} // namespace artifact::service
