#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "ingestion_queue.hpp"

namespace bibmirror::runtime {

/*
  Dedicated thread running ingestion jobs one at a time.

  Callers never block on an operation: Submit returns a future and
  progress flows through the job's own sink. CancelCurrent stops the
  running job only; CancelAll also stops queued jobs, which then start
  with a stopped token.
*/
class IngestionWorker {
 public:
  explicit IngestionWorker(std::shared_ptr<IngestionQueue> queue = std::make_shared<IngestionQueue>());
  ~IngestionWorker();

  IngestionWorker(const IngestionWorker&)            = delete;
  IngestionWorker& operator=(const IngestionWorker&) = delete;

  void Start();

  // Runs every queued job, then joins.
  void Stop();

  std::future<model::IngestResult> Submit(std::string name, std::function<model::IngestResult(std::stop_token)> run);

  // Requests stop of the running job; false when idle.
  bool CancelCurrent();

  // Requests stop of the running and every queued job; returns how many
  // jobs were still outstanding.
  size_t CancelAll();

  bool Busy() const {
    return busy_;
  }

 private:
  void Run();

  std::shared_ptr<IngestionQueue> queue_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> busy_{false};

  std::mutex                      current_mutex_;
  std::optional<std::stop_source> current_stop_;
  std::vector<std::stop_source>   outstanding_;
};

} // namespace bibmirror::runtime
