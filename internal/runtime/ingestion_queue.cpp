#include "ingestion_queue.hpp"

namespace bibmirror::runtime {

bool IngestionQueue::Enqueue(IngestionJob& job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

std::optional<IngestionJob> IngestionQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  IngestionJob job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void IngestionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t IngestionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace bibmirror::runtime
