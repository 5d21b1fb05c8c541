#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "ingestion_job.hpp"

namespace bibmirror::runtime {

/*
  Thread-safe blocking queue feeding the ingestion worker.
*/
class IngestionQueue {
 public:
  // false once shut down; the job is left untouched
  bool Enqueue(IngestionJob& job);

  // blocking wait; nullopt after shutdown once the queue is drained
  std::optional<IngestionJob> Dequeue();

  void Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<IngestionJob> queue_;
  bool                     shutdown_ = false;
};

} // namespace bibmirror::runtime
