#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace artifact::grpc {

AdminServer::AdminServer(std::shared_ptr<artifact::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const artifact::manager::v1::HealthRequest* req,
                               artifact::manager::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const artifact::manager::v1::StatsRequest* req,
                               artifact::manager::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::MigrationPreview(::grpc::ServerContext*, const artifact::manager::v1::MigrationPreviewRequest* req,
                               artifact::manager::v1::MigrationPreviewResponse* resp) {
  try {
    *resp = service_->MigrationPreview(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Migrate(::grpc::ServerContext*, const artifact::manager::v1::MigrateRequest* req,
                               artifact::manager::v1::MigrateResponse* resp) {
  try {
    *resp = service_->Migrate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace artifact::grpc
