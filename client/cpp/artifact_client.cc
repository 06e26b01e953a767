#include "client/cpp/artifact_client.h"

#include <thread>

namespace artifact::manager::client {

using namespace artifact::manager::v1;

namespace {

constexpr const char* kChannelMetadataKey = "x-artifact-channel";

bool IsTerminal(JobStatus status) {
  return status == JOB_STATUS_COMPLETED || status == JOB_STATUS_FAILED;
}

} // namespace

ArtifactClient::ArtifactClient(std::shared_ptr<::grpc::Channel> channel)
    : generation_stub_(ArtifactGenerationService::NewStub(channel)),
      catalog_stub_(ArtifactCatalogService::NewStub(channel)),
      realtime_stub_(ArtifactRealtimeService::NewStub(channel)),
      admin_stub_(ArtifactAdminService::NewStub(channel)) {
}

::grpc::Status ArtifactClient::Generate(const GenerationRequest& request, std::string* job_id) const {
  GenerateRequest req;
  *req.mutable_request() = request;
  GenerateResponse    resp;
  ::grpc::ClientContext ctx;
  auto                status = generation_stub_->Generate(&ctx, req, &resp);
  if (status.ok() && job_id) *job_id = resp.job_id();
  return status;
}

::grpc::Status ArtifactClient::GetJob(const std::string& job_id, GenerationJob* job) const {
  GetJobRequest req;
  req.set_job_id(job_id);
  GetJobResponse      resp;
  ::grpc::ClientContext ctx;
  auto                status = generation_stub_->GetJob(&ctx, req, &resp);
  if (status.ok() && job) *job = resp.job();
  return status;
}

::grpc::Status ArtifactClient::ListJobs(uint32_t limit, std::vector<GenerationJob>* jobs) const {
  ListJobsRequest req;
  req.set_limit(limit);
  ListJobsResponse    resp;
  ::grpc::ClientContext ctx;
  auto                status = generation_stub_->ListJobs(&ctx, req, &resp);
  if (status.ok() && jobs) jobs->assign(resp.jobs().begin(), resp.jobs().end());
  return status;
}

::grpc::Status ArtifactClient::WaitForJob(const std::string& job_id, const RetryPolicy& policy, GenerationJob* job) const {
  const auto give_up_at = std::chrono::steady_clock::now() + policy.deadline;

  GenerationJob last;
  for (uint32_t attempt = 1;; ++attempt) {
    auto status = GetJob(job_id, &last);
    if (!status.ok()) return status;
    if (job) *job = last;
    if (IsTerminal(last.status())) return ::grpc::Status::OK;

    if (policy.max_attempts != 0 && attempt >= policy.max_attempts) {
      return {::grpc::StatusCode::DEADLINE_EXCEEDED, "job " + job_id + " not finished after " + std::to_string(attempt) + " polls"};
    }
    if (std::chrono::steady_clock::now() + policy.interval > give_up_at) {
      return {::grpc::StatusCode::DEADLINE_EXCEEDED, "job " + job_id + " not finished before deadline"};
    }
    std::this_thread::sleep_for(policy.interval);
  }
}

::grpc::Status ArtifactClient::GetArtifact(const std::string& artifact_id, ArtifactVersion* artifact) const {
  GetArtifactRequest req;
  req.set_artifact_id(artifact_id);
  GetArtifactResponse resp;
  ::grpc::ClientContext ctx;
  auto                status = catalog_stub_->GetArtifact(&ctx, req, &resp);
  if (status.ok() && artifact) *artifact = resp.artifact();
  return status;
}

::grpc::Status ArtifactClient::GetVersion(const std::string& artifact_id, uint32_t version, ArtifactVersion* artifact) const {
  GetVersionRequest req;
  req.set_artifact_id(artifact_id);
  req.set_version(version);
  GetVersionResponse  resp;
  ::grpc::ClientContext ctx;
  auto                status = catalog_stub_->GetVersion(&ctx, req, &resp);
  if (status.ok() && artifact) *artifact = resp.artifact();
  return status;
}

::grpc::Status ArtifactClient::ListVersions(const std::string& artifact_id, std::vector<ArtifactVersion>* versions) const {
  ListVersionsRequest req;
  req.set_artifact_id(artifact_id);
  ListVersionsResponse resp;
  ::grpc::ClientContext  ctx;
  auto                 status = catalog_stub_->ListVersions(&ctx, req, &resp);
  if (status.ok() && versions) versions->assign(resp.versions().begin(), resp.versions().end());
  return status;
}

::grpc::Status ArtifactClient::ListArtifacts(std::vector<std::string>* artifact_ids) const {
  ListArtifactsRequest  req;
  ListArtifactsResponse resp;
  ::grpc::ClientContext   ctx;
  auto                  status = catalog_stub_->ListArtifacts(&ctx, req, &resp);
  if (status.ok() && artifact_ids) artifact_ids->assign(resp.artifact_ids().begin(), resp.artifact_ids().end());
  return status;
}

::grpc::Status ArtifactClient::RestoreVersion(const std::string& artifact_id, uint32_t version, ArtifactVersion* artifact) const {
  RestoreVersionRequest req;
  req.set_artifact_id(artifact_id);
  req.set_version(version);
  RestoreVersionResponse resp;
  ::grpc::ClientContext    ctx;
  auto                   status = catalog_stub_->RestoreVersion(&ctx, req, &resp);
  if (status.ok() && artifact) *artifact = resp.artifact();
  return status;
}

::grpc::Status ArtifactClient::CompareVersions(const std::string& artifact_id, uint32_t version_a, uint32_t version_b,
                                             VersionComparison* comparison) const {
  CompareVersionsRequest req;
  req.set_artifact_id(artifact_id);
  req.set_version_a(version_a);
  req.set_version_b(version_b);
  CompareVersionsResponse resp;
  ::grpc::ClientContext     ctx;
  auto                    status = catalog_stub_->CompareVersions(&ctx, req, &resp);
  if (status.ok() && comparison) *comparison = resp.comparison();
  return status;
}

::grpc::Status ArtifactClient::Health(HealthResponse* resp) const {
  HealthRequest       req;
  ::grpc::ClientContext ctx;
  return admin_stub_->Health(&ctx, req, resp);
}

::grpc::Status ArtifactClient::Stats(StatsResponse* resp) const {
  StatsRequest        req;
  ::grpc::ClientContext ctx;
  return admin_stub_->Stats(&ctx, req, resp);
}

::grpc::Status ArtifactClient::MigrationPreview(MigrationPreviewResponse* resp) const {
  MigrationPreviewRequest req;
  ::grpc::ClientContext     ctx;
  return admin_stub_->MigrationPreview(&ctx, req, resp);
}

::grpc::Status ArtifactClient::Migrate(MigrateResponse* resp) const {
  MigrateRequest      req;
  ::grpc::ClientContext ctx;
  return admin_stub_->Migrate(&ctx, req, resp);
}

std::unique_ptr<::grpc::ClientReaderWriter<ClientMessage, Event>> ArtifactClient::Connect(const std::string& channel,
                                                                                        ::grpc::ClientContext* context) const {
  context->AddMetadata(kChannelMetadataKey, channel);
  return realtime_stub_->Connect(context);
}

} // namespace artifact::manager::client
