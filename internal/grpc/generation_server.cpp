#include "generation_server.hpp"

#include "grpc_error.hpp"

namespace artifact::grpc {

GenerationServer::GenerationServer(std::shared_ptr<artifact::service::GenerationService> svc) : service_(std::move(svc)) {
}

::grpc::Status GenerationServer::Generate(::grpc::ServerContext*, const artifact::manager::v1::GenerateRequest* req,
                                          artifact::manager::v1::GenerateResponse* resp) {
  try {
    *resp = service_->Generate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::GetJob(::grpc::ServerContext*, const artifact::manager::v1::GetJobRequest* req,
                                        artifact::manager::v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::ListJobs(::grpc::ServerContext*, const artifact::manager::v1::ListJobsRequest* req,
                                          artifact::manager::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace artifact::grpc
