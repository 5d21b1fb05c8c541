#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/family.hpp"

namespace bibmirror::ingest {

namespace progress {

struct DiskSpace {
  std::optional<uint64_t> free_bytes;
};

struct SearchTableDefinition {
  uint64_t position = 0;
  uint64_t total    = 0;
};

struct TableDefinitionFound {
  bibmirror::model::Family family;
};

struct WrongTableDefinition {
  bibmirror::model::Family expected;
  bibmirror::model::Family found;
};

struct CreateIndex {
  std::string column;
};

struct LoadRemoteIds {};

struct ImportObjects {
  uint64_t added   = 0;
  uint64_t updated = 0;
};

struct SyncObjects {
  uint64_t downloaded = 0;
  uint64_t added      = 0;
  uint64_t updated    = 0;
};

struct Completed {
  uint64_t added   = 0;
  uint64_t updated = 0;
};

} // namespace progress

using ProgressEvent = std::variant<progress::DiskSpace,
                                   progress::SearchTableDefinition,
                                   progress::TableDefinitionFound,
                                   progress::WrongTableDefinition,
                                   progress::CreateIndex,
                                   progress::LoadRemoteIds,
                                   progress::ImportObjects,
                                   progress::SyncObjects,
                                   progress::Completed>;

std::string Describe(const ProgressEvent& event);

/*
  Consumer of pipeline progress. Called on the ingestion worker thread;
  implementations hand events off rather than block.
*/
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  virtual void OnProgress(const ProgressEvent& event) = 0;
};

class CallbackProgressSink final : public ProgressSink {
 public:
  explicit CallbackProgressSink(std::function<void(const ProgressEvent&)> callback);

  void OnProgress(const ProgressEvent& event) override;

 private:
  std::function<void(const ProgressEvent&)> callback_;
};

// Writes every event to the process log.
class LoggingProgressSink final : public ProgressSink {
 public:
  void OnProgress(const ProgressEvent& event) override;
};

/*
  Rate limits scan-position events to one per interval. Every other
  event kind marks a state change and is always forwarded.
*/
class ThrottledProgressSink final : public ProgressSink {
 public:
  using Clock = std::chrono::steady_clock;

  ThrottledProgressSink(ProgressSink& inner, std::chrono::milliseconds interval);

  void OnProgress(const ProgressEvent& event) override;

 private:
  ProgressSink&             inner_;
  std::chrono::milliseconds interval_;
  std::optional<Clock::time_point> last_scan_event_;
};

} // namespace bibmirror::ingest
