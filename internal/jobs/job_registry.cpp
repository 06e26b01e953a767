#include "job_registry.hpp"

#include <algorithm>
#include <functional>

#include "internal/jobs/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace artifact::jobs {

using artifact::manager::v1::ErrorKind;
using artifact::manager::v1::GenerationJob;
using artifact::manager::v1::GenerationRequest;
using artifact::manager::v1::JobStatus;
using artifact::observability::StringField;

std::shared_mutex& JobRegistry::JobShard(const std::string& job_id) const {
  return job_mu_[std::hash<std::string>{}(job_id) % kJobLockShardCount];
}

std::string JobRegistry::Create(const GenerationRequest& request) {
  auto entry = std::make_shared<Entry>();

  const auto job_id = util::GenerateUUIDString();
  const auto now    = util::ToProto(util::Now());

  auto& job = entry->job;
  job.set_job_id(job_id);
  job.set_artifact_type(request.artifact_type());
  *job.mutable_request() = request;
  job.set_status(JobStatus::JOB_STATUS_QUEUED);
  job.set_progress(0.0);
  *job.mutable_created_at() = now;
  *job.mutable_updated_at() = now;

  {
    std::unique_lock lock(jobs_mu_);
    entry->sequence = ++next_sequence_;
    jobs_.emplace(job_id, std::move(entry));
  }
  return job_id;
}

template <typename Fn>
void JobRegistry::Transition(const std::string& job_id, JobStatus to, bool allow_same, Fn&& mutate) {
  std::shared_ptr<Entry> entry;
  {
    std::shared_lock lock(jobs_mu_);
    auto             it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      throw util::NotFound("job not found: " + job_id);
    }
    entry = it->second;
  }

  std::unique_lock job_lock(JobShard(job_id));
  auto&            job  = entry->job;
  const auto       from = job.status();

  const bool allowed = (from == to) ? allow_same : CanTransition(from, to);
  if (!allowed) {
    ARTIFACT_LOG_ERROR("Illegal job transition",
                       {StringField("job_id", job_id), StringField("from", StatusName(from)), StringField("to", StatusName(to))});
    throw util::InvalidTransition("job " + job_id + ": " + StatusName(from) + " -> " + StatusName(to));
  }

  job.set_status(to);
  mutate(job);
  *job.mutable_updated_at() = util::ToProto(util::Now());
}

void JobRegistry::MarkRunning(const std::string& job_id) {
  Transition(job_id, JobStatus::JOB_STATUS_RUNNING, false, [](GenerationJob&) {});
}

void JobRegistry::UpdateProgress(const std::string& job_id, double progress, const std::string& message) {
  // progress keeps the job running and is only legal there
  Transition(job_id, JobStatus::JOB_STATUS_RUNNING, true, [&](GenerationJob& job) {
    job.set_progress(std::clamp(progress, 0.0, 1.0));
    job.set_message(message);
  });
}

void JobRegistry::MarkCompleted(const std::string& job_id, const std::string& artifact_id, uint32_t version) {
  Transition(job_id, JobStatus::JOB_STATUS_COMPLETED, false, [&](GenerationJob& job) {
    job.set_progress(1.0);
    job.set_result_artifact_id(artifact_id);
    job.set_result_version(version);
  });
}

void JobRegistry::MarkFailed(const std::string& job_id, ErrorKind kind, const std::string& error) {
  Transition(job_id, JobStatus::JOB_STATUS_FAILED, false, [&](GenerationJob& job) {
    job.set_error(error);
    job.set_error_kind(kind);
  });
}

std::optional<GenerationJob> JobRegistry::Get(const std::string& job_id) const {
  std::shared_ptr<Entry> entry;
  {
    std::shared_lock lock(jobs_mu_);
    auto             it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    entry = it->second;
  }

  std::shared_lock job_lock(JobShard(job_id));
  return entry->job;
}

std::vector<GenerationJob> JobRegistry::List(std::size_t limit) const {
  if (limit == 0) limit = kDefaultListLimit;

  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(jobs_mu_);
    entries.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) {
      entries.push_back(entry);
    }
  }

  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a->sequence > b->sequence; });
  if (entries.size() > limit) entries.resize(limit);

  std::vector<GenerationJob> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    std::shared_lock job_lock(JobShard(entry->job.job_id()));
    out.push_back(entry->job);
  }
  return out;
}

JobCounts JobRegistry::Counts() const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(jobs_mu_);
    entries.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) {
      entries.push_back(entry);
    }
  }

  JobCounts counts;
  for (const auto& entry : entries) {
    JobStatus status;
    {
      std::shared_lock job_lock(JobShard(entry->job.job_id()));
      status = entry->job.status();
    }
    switch (status) {
      case JobStatus::JOB_STATUS_QUEUED:
        ++counts.queued;
        break;
      case JobStatus::JOB_STATUS_RUNNING:
        ++counts.running;
        break;
      case JobStatus::JOB_STATUS_COMPLETED:
        ++counts.completed;
        break;
      case JobStatus::JOB_STATUS_FAILED:
        ++counts.failed;
        break;
      default:
        break;
    }
  }
  return counts;
}

} // namespace artifact::jobs
