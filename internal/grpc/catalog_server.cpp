#include "catalog_server.hpp"

#include "grpc_error.hpp"

namespace artifact::grpc {

CatalogServer::CatalogServer(std::shared_ptr<artifact::service::CatalogService> svc) : service_(std::move(svc)) {
}

::grpc::Status CatalogServer::GetArtifact(::grpc::ServerContext*, const artifact::manager::v1::GetArtifactRequest* req,
                                 artifact::manager::v1::GetArtifactResponse* resp) {
  try {
    *resp = service_->GetArtifact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetVersion(::grpc::ServerContext*, const artifact::manager::v1::GetVersionRequest* req,
                                 artifact::manager::v1::GetVersionResponse* resp) {
  try {
    *resp = service_->GetVersion(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListVersions(::grpc::ServerContext*, const artifact::manager::v1::ListVersionsRequest* req,
                                 artifact::manager::v1::ListVersionsResponse* resp) {
  try {
    *resp = service_->ListVersions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListArtifacts(::grpc::ServerContext*, const artifact::manager::v1::ListArtifactsRequest* req,
                                 artifact::manager::v1::ListArtifactsResponse* resp) {
  try {
    *resp = service_->ListArtifacts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::RestoreVersion(::grpc::ServerContext*, const artifact::manager::v1::RestoreVersionRequest* req,
                                 artifact::manager::v1::RestoreVersionResponse* resp) {
  try {
    *resp = service_->RestoreVersion(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::CompareVersions(::grpc::ServerContext*, const artifact::manager::v1::CompareVersionsRequest* req,
                                 artifact::manager::v1::CompareVersionsResponse* resp) {
  try {
    *resp = service_->CompareVersions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace artifact::grpc
