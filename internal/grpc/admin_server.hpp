#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "artifact/manager/v1.hpp"
#include "internal/service/admin_service.hpp"

namespace artifact::grpc {

class AdminServer final : public artifact::manager::v1::ArtifactAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<artifact::service::AdminService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const artifact::manager::v1::HealthRequest*, artifact::manager::v1::HealthResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const artifact::manager::v1::StatsRequest*, artifact::manager::v1::StatsResponse*) override;

  ::grpc::Status MigrationPreview(::grpc::ServerContext*, const artifact::manager::v1::MigrationPreviewRequest*, artifact::manager::v1::MigrationPreviewResponse*) override;

  ::grpc::Status Migrate(::grpc::ServerContext*, const artifact::manager::v1::MigrateRequest*, artifact::manager::v1::MigrateResponse*) override;

 private:
  std::shared_ptr<artifact::service::AdminService> service_;
};

} // namespace artifact::grpc
