#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "artifact/manager/v1.hpp"

namespace artifact::jobs {

struct JobCounts {
  uint64_t queued    = 0;
  uint64_t running   = 0;
  uint64_t completed = 0;
  uint64_t failed    = 0;
};

/*
  Owns every GenerationJob and its state machine.

  The job map is guarded by a shared mutex; mutations of one job are
  serialized by a sharded per-job mutex so different jobs never wait on
  each other. Illegal transitions throw util::InvalidTransition and leave
  the job unchanged. Completed and failed jobs are kept for polling.
*/
class JobRegistry {
 public:
  static constexpr std::size_t kDefaultListLimit = 50;

  std::string Create(const artifact::manager::v1::GenerationRequest& request);

  void MarkRunning(const std::string& job_id);
  void UpdateProgress(const std::string& job_id, double progress, const std::string& message);
  void MarkCompleted(const std::string& job_id, const std::string& artifact_id, uint32_t version);
  void MarkFailed(const std::string& job_id, artifact::manager::v1::ErrorKind kind, const std::string& error);

  std::optional<artifact::manager::v1::GenerationJob> Get(const std::string& job_id) const;

  // newest first; limit 0 means kDefaultListLimit
  std::vector<artifact::manager::v1::GenerationJob> List(std::size_t limit = kDefaultListLimit) const;

  JobCounts Counts() const;

 private:
  static constexpr std::size_t kJobLockShardCount = 64;

  struct Entry {
    artifact::manager::v1::GenerationJob job;
    uint64_t                             sequence = 0;
  };

  std::shared_mutex& JobShard(const std::string& job_id) const;

  // Locks the job's shard, checks the transition and applies mutate.
  // allow_same permits staying in the current status.
  template <typename Fn>
  void Transition(const std::string& job_id, artifact::manager::v1::JobStatus to, bool allow_same, Fn&& mutate);

  mutable std::shared_mutex                                 jobs_mu_;
  std::unordered_map<std::string, std::shared_ptr<Entry>>   jobs_;
  uint64_t                                                  next_sequence_ = 0;
  mutable std::array<std::shared_mutex, kJobLockShardCount> job_mu_;
};

} // namespace artifact::jobs
