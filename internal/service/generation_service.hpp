#pragma once

#include "artifact/manager/v1.hpp"
#include "service_context.hpp"

namespace artifact::service {

class GenerationService {
 public:
  explicit GenerationService(ServiceContext ctx);

  artifact::manager::v1::GenerateResponse Generate(const artifact::manager::v1::GenerateRequest& req);

  artifact::manager::v1::GetJobResponse GetJob(const artifact::manager::v1::GetJobRequest& req);

  artifact::manager::v1::ListJobsResponse ListJobs(const artifact::manager::v1::ListJobsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace artifact::service
