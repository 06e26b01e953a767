#include "generation_service.hpp"

#include "internal/jobs/job_registry.hpp"
#include "internal/jobs/job_runner.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace artifact::service {

using namespace artifact::manager::v1;

GenerationService::GenerationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GenerateResponse GenerationService::Generate(const GenerateRequest& req) {
  return ObserveRpc("ArtifactGenerationService.Generate", "artifact.type", req.request().artifact_type(), [&] {
    GenerateResponse resp;
    resp.set_job_id(ctx_.runner->Submit(req.request()));
    resp.set_status(JobStatus::JOB_STATUS_QUEUED);
    return resp;
  });
}

GetJobResponse GenerationService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("ArtifactGenerationService.GetJob", "job.id", req.job_id(), [&] {
    if (req.job_id().empty()) {
      throw util::ValidationError("job_id is required");
    }

    auto job = ctx_.registry->Get(req.job_id());
    if (!job) {
      throw util::NotFound("job not found: " + req.job_id());
    }

    GetJobResponse resp;
    *resp.mutable_job() = std::move(*job);
    return resp;
  });
}

ListJobsResponse GenerationService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("ArtifactGenerationService.ListJobs", "", "", [&] {
    ListJobsResponse resp;
    for (auto& job : ctx_.registry->List(req.limit())) {
      *resp.add_jobs() = std::move(job);
    }
    return resp;
  });
}

} // namespace artifact::service
