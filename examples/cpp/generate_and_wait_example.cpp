#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "artifact/manager/v1.hpp"
#include "client/cpp/artifact_client.h"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target        = argc > 1 ? argv[1] : "localhost:50061";
  const std::string artifact_type = argc > 2 ? argv[2] : "mermaid_erd";

  artifact::manager::client::ArtifactClient client(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()));

  artifact::manager::v1::GenerationRequest request;
  request.set_artifact_type(artifact_type);
  request.set_meeting_notes("Customers place orders; each order has many line items referencing products.");

  std::string job_id;
  auto        status = client.Generate(request, &job_id);
  if (!status.ok()) {
    std::cerr << "Generate failed: " << status.error_message() << '\n';
    return 1;
  }
  std::cout << "submitted job " << job_id << '\n';

  // Poll every 500 ms for at most 30 s.
  artifact::manager::client::RetryPolicy policy;
  policy.interval = std::chrono::milliseconds(500);
  policy.deadline = std::chrono::seconds(30);

  artifact::manager::v1::GenerationJob job;
  status = client.WaitForJob(job_id, policy, &job);
  if (!status.ok()) {
    std::cerr << "WaitForJob failed: " << status.error_message() << '\n';
    return 1;
  }
  if (job.status() != artifact::manager::v1::JOB_STATUS_COMPLETED) {
    std::cerr << "job failed: " << job.error() << '\n';
    return 1;
  }

  std::vector<artifact::manager::v1::ArtifactVersion> versions;
  status = client.ListVersions(job.result_artifact_id(), &versions);
  if (!status.ok()) {
    std::cerr << "ListVersions failed: " << status.error_message() << '\n';
    return 1;
  }

  std::cout << job.result_artifact_id() << " now has " << versions.size() << " version(s); current is v" << job.result_version() << '\n';
  return 0;
}
