#include "ingestion_worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bibmirror::runtime {

IngestionWorker::IngestionWorker(std::shared_ptr<IngestionQueue> queue) : queue_(std::move(queue)) {
}

IngestionWorker::~IngestionWorker() {
  Stop();
}

void IngestionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&IngestionWorker::Run, this);
}

void IngestionWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

std::future<model::IngestResult> IngestionWorker::Submit(std::string name,
                                                         std::function<model::IngestResult(std::stop_token)> run) {
  IngestionJob job{std::move(name), std::move(run), {}, {}};
  auto         future = job.done.get_future();
  auto         stop   = job.stop;

  {
    std::lock_guard lock(current_mutex_);
    outstanding_.push_back(stop);
  }
  if (!queue_->Enqueue(job)) {
    {
      std::lock_guard lock(current_mutex_);
      std::erase(outstanding_, stop);
    }
    job.done.set_value(model::IngestResult::Failed(model::ErrorKind::kInternal, "ingestion worker stopped"));
  }
  return future;
}

bool IngestionWorker::CancelCurrent() {
  std::lock_guard lock(current_mutex_);
  if (!current_stop_) return false;
  return current_stop_->request_stop();
}

size_t IngestionWorker::CancelAll() {
  std::lock_guard lock(current_mutex_);
  for (auto& stop : outstanding_) stop.request_stop();
  return outstanding_.size();
}

void IngestionWorker::Run() {
  while (auto job = queue_->Dequeue()) {
    std::stop_token token;
    {
      std::lock_guard lock(current_mutex_);
      current_stop_ = job->stop;
      token         = job->stop.get_token();
    }
    busy_ = true;

    BIBMIRROR_LOG_DEBUG("ingestion job started", {observability::StringField("job", job->name)});

    model::IngestResult result;
    try {
      result = job->run(token);
    } catch (const std::exception& e) {
      result = model::IngestResult::Failed(model::ErrorKind::kInternal, e.what());
    }

    {
      std::lock_guard lock(current_mutex_);
      current_stop_.reset();
      std::erase(outstanding_, job->stop);
    }
    busy_ = false;

    BIBMIRROR_LOG_DEBUG("ingestion job finished",
                        {observability::StringField("job", job->name), observability::StringField("status", model::ToString(result.status))});
    job->done.set_value(std::move(result));
  }
}

} // namespace bibmirror::runtime
