#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "artifact/manager/v1.hpp"
#include "internal/service/catalog_service.hpp"

namespace artifact::grpc {

class CatalogServer final : public artifact::manager::v1::ArtifactCatalogService::Service {
 public:
  explicit CatalogServer(std::shared_ptr<artifact::service::CatalogService> svc);

  ::grpc::Status GetArtifact(::grpc::ServerContext*, const artifact::manager::v1::GetArtifactRequest*, artifact::manager::v1::GetArtifactResponse*) override;

  ::grpc::Status GetVersion(::grpc::ServerContext*, const artifact::manager::v1::GetVersionRequest*, artifact::manager::v1::GetVersionResponse*) override;

  ::grpc::Status ListVersions(::grpc::ServerContext*, const artifact::manager::v1::ListVersionsRequest*, artifact::manager::v1::ListVersionsResponse*) override;

  ::grpc::Status ListArtifacts(::grpc::ServerContext*, const artifact::manager::v1::ListArtifactsRequest*, artifact::manager::v1::ListArtifactsResponse*) override;

  ::grpc::Status RestoreVersion(::grpc::ServerContext*, const artifact::manager::v1::RestoreVersionRequest*, artifact::manager::v1::RestoreVersionResponse*) override;

  ::grpc::Status CompareVersions(::grpc::ServerContext*, const artifact::manager::v1::CompareVersionsRequest*, artifact::manager::v1::CompareVersionsResponse*) override;

 private:
  std::shared_ptr<artifact::service::CatalogService> service_;
};

} // namespace artifact::grpc
