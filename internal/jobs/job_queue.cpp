#include "job_queue.hpp"

namespace artifact::jobs {

bool JobQueue::Enqueue(const std::string& job_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(job_id);
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  std::string job_id = std::move(queue_.front());
  queue_.pop();
  return job_id;
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t JobQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool JobQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace artifact::jobs
