#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "artifact/manager/v1.hpp"

namespace artifact::manager::client {

/*
  Polling policy for WaitForJob.

  GetJob is retried every interval until the job is terminal, the deadline
  has passed or max_attempts polls were made (0 means no attempt limit).
*/
struct RetryPolicy {
  std::chrono::milliseconds interval{2000};
  std::chrono::milliseconds deadline{120000};
  uint32_t                  max_attempts = 0;
};

class ArtifactClient {
 public:
  explicit ArtifactClient(std::shared_ptr<::grpc::Channel> channel);

  ::grpc::Status Generate(const artifact::manager::v1::GenerationRequest& request, std::string* job_id) const;

  ::grpc::Status GetJob(const std::string& job_id, artifact::manager::v1::GenerationJob* job) const;

  ::grpc::Status ListJobs(uint32_t limit, std::vector<artifact::manager::v1::GenerationJob>* jobs) const;

  // DEADLINE_EXCEEDED when the policy gives up before the job is terminal;
  // job then holds the last observed state
  ::grpc::Status WaitForJob(const std::string& job_id, const RetryPolicy& policy, artifact::manager::v1::GenerationJob* job) const;

  ::grpc::Status GetArtifact(const std::string& artifact_id, artifact::manager::v1::ArtifactVersion* artifact) const;

  ::grpc::Status GetVersion(const std::string& artifact_id, uint32_t version, artifact::manager::v1::ArtifactVersion* artifact) const;

  ::grpc::Status ListVersions(const std::string& artifact_id, std::vector<artifact::manager::v1::ArtifactVersion>* versions) const;

  ::grpc::Status ListArtifacts(std::vector<std::string>* artifact_ids) const;

  ::grpc::Status RestoreVersion(const std::string& artifact_id, uint32_t version, artifact::manager::v1::ArtifactVersion* artifact) const;

  ::grpc::Status CompareVersions(const std::string& artifact_id, uint32_t version_a, uint32_t version_b,
                               artifact::manager::v1::VersionComparison* comparison) const;

  ::grpc::Status Health(artifact::manager::v1::HealthResponse* resp) const;

  ::grpc::Status Stats(artifact::manager::v1::StatsResponse* resp) const;

  ::grpc::Status MigrationPreview(artifact::manager::v1::MigrationPreviewResponse* resp) const;

  ::grpc::Status Migrate(artifact::manager::v1::MigrateResponse* resp) const;

  // Opens the realtime stream on channel; context must outlive the stream.
  std::unique_ptr<::grpc::ClientReaderWriter<artifact::manager::v1::ClientMessage, artifact::manager::v1::Event>> Connect(
      const std::string& channel, ::grpc::ClientContext* context) const;

 private:
  std::unique_ptr<artifact::manager::v1::ArtifactGenerationService::Stub> generation_stub_;
  std::unique_ptr<artifact::manager::v1::ArtifactCatalogService::Stub>    catalog_stub_;
  std::unique_ptr<artifact::manager::v1::ArtifactRealtimeService::Stub>   realtime_stub_;
  std::unique_ptr<artifact::manager::v1::ArtifactAdminService::Stub>      admin_stub_;
};

} // namespace artifact::manager::client
