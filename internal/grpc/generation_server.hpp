#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "artifact/manager/v1.hpp"
#include "internal/service/generation_service.hpp"

namespace artifact::grpc {

class GenerationServer final : public artifact::manager::v1::ArtifactGenerationService::Service {
 public:
  explicit GenerationServer(std::shared_ptr<artifact::service::GenerationService> svc);

  ::grpc::Status Generate(::grpc::ServerContext*, const artifact::manager::v1::GenerateRequest*,
                          artifact::manager::v1::GenerateResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*, const artifact::manager::v1::GetJobRequest*, artifact::manager::v1::GetJobResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*, const artifact::manager::v1::ListJobsRequest*,
                          artifact::manager::v1::ListJobsResponse*) override;

 private:
  std::shared_ptr<artifact::service::GenerationService> service_;
};

} // namespace artifact::grpc
