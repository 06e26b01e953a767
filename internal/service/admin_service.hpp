#pragma once

#include "artifact/manager/v1.hpp"
#include "service_context.hpp"

namespace artifact::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  artifact::manager::v1::HealthResponse Health(const artifact::manager::v1::HealthRequest& req);

  artifact::manager::v1::StatsResponse Stats(const artifact::manager::v1::StatsRequest& req);

  artifact::manager::v1::MigrationPreviewResponse MigrationPreview(const artifact::manager::v1::MigrationPreviewRequest& req);

  artifact::manager::v1::MigrateResponse Migrate(const artifact::manager::v1::MigrateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace artifact::service
