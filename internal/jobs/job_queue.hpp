#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace artifact::jobs {

/*
  Thread-safe blocking queue of job ids for the runner's workers.

  After Shutdown() workers keep draining what was queued; Dequeue returns
  std::nullopt only once the queue is both shut down and empty.
*/
class JobQueue {
 public:
  // false once the queue is shut down
  bool Enqueue(const std::string& job_id);

  // blocking wait
  std::optional<std::string> Dequeue();

  void Shutdown();

  std::size_t Depth() const;
  bool        IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool                    shutdown_ = false;
};

} // namespace artifact::jobs
