#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "artifact/manager/v1.hpp"
#include "internal/jobs/job_queue.hpp"

namespace artifact::versioning {
class VersionStore;
}
namespace artifact::generation {
class GeneratorRegistry;
}
namespace artifact::notify {
class NotificationHub;
}

namespace artifact::jobs {

class JobRegistry;

struct JobRunnerOptions {
  uint32_t worker_threads    = 4;
  uint64_t max_request_bytes = 10ull * 1024 * 1024;
};

/*
  Executes generation jobs on a fixed worker pool.

  Submit validates, registers the job as queued and returns its id without
  waiting. A worker then runs the job:

      queued -> running -> (generate, append version) -> completed
                       \-> failed

  The registry transition always commits before the matching event is
  published, and a job is marked completed only after its version is
  durable. Execution failures are recorded on the job and never reach the
  submitter.
*/
class JobRunner {
 public:
  JobRunner(std::shared_ptr<JobRegistry> registry, std::shared_ptr<artifact::versioning::VersionStore> store,
            std::shared_ptr<artifact::generation::GeneratorRegistry> generators, std::shared_ptr<artifact::notify::NotificationHub> hub,
            JobRunnerOptions options = {});
  ~JobRunner();

  JobRunner(const JobRunner&)            = delete;
  JobRunner& operator=(const JobRunner&) = delete;

  void Start();

  // stops accepting work, finishes every queued job, joins the workers
  void Stop();

  bool Accepting() const;

  // throws util::ValidationError, or util::InvalidState when not accepting
  std::string Submit(artifact::manager::v1::GenerationRequest request);

  // throws util::ValidationError describing the first problem found
  void Validate(const artifact::manager::v1::GenerationRequest& request) const;

  static bool IsValidArtifactId(const std::string& artifact_id);

 private:
  void Run();
  void Execute(const std::string& job_id);
  void Fail(const std::string& job_id, const std::string& artifact_type, artifact::manager::v1::ErrorKind kind, const std::string& error);

  std::shared_ptr<JobRegistry>                             registry_;
  std::shared_ptr<artifact::versioning::VersionStore>      store_;
  std::shared_ptr<artifact::generation::GeneratorRegistry> generators_;
  std::shared_ptr<artifact::notify::NotificationHub>       hub_;
  JobRunnerOptions                                         options_;

  std::mutex               submit_mu_;
  JobQueue                 queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace artifact::jobs
