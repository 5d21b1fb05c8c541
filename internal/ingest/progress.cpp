#include "internal/ingest/progress.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"

namespace bibmirror::ingest {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string Describe(const ProgressEvent& event) {
  using bibmirror::model::ToString;

  return std::visit(
      Overloaded{
          [](const progress::DiskSpace& e) {
            return e.free_bytes ? fmt::format("free disk space {} bytes", *e.free_bytes) : std::string("free disk space unknown");
          },
          [](const progress::SearchTableDefinition& e) { return fmt::format("scanning dump {}/{}", e.position, e.total); },
          [](const progress::TableDefinitionFound& e) { return fmt::format("found {} table", ToString(e.family)); },
          [](const progress::WrongTableDefinition& e) {
            return fmt::format("expected {} table, found {}", ToString(e.expected), ToString(e.found));
          },
          [](const progress::CreateIndex& e) { return fmt::format("creating index on {}", e.column); },
          [](const progress::LoadRemoteIds&) { return std::string("loading stored remote ids"); },
          [](const progress::ImportObjects& e) { return fmt::format("imported added={} updated={}", e.added, e.updated); },
          [](const progress::SyncObjects& e) {
            return fmt::format("synchronized downloaded={} added={} updated={}", e.downloaded, e.added, e.updated);
          },
          [](const progress::Completed& e) { return fmt::format("completed added={} updated={}", e.added, e.updated); },
      },
      event);
}

CallbackProgressSink::CallbackProgressSink(std::function<void(const ProgressEvent&)> callback) : callback_(std::move(callback)) {
}

void CallbackProgressSink::OnProgress(const ProgressEvent& event) {
  if (callback_) callback_(event);
}

void LoggingProgressSink::OnProgress(const ProgressEvent& event) {
  BIBMIRROR_LOG_INFO(Describe(event));
}

ThrottledProgressSink::ThrottledProgressSink(ProgressSink& inner, std::chrono::milliseconds interval)
    : inner_(inner), interval_(interval) {
}

void ThrottledProgressSink::OnProgress(const ProgressEvent& event) {
  if (std::holds_alternative<progress::SearchTableDefinition>(event)) {
    const auto now = Clock::now();
    if (last_scan_event_ && now - *last_scan_event_ < interval_) return;
    last_scan_event_ = now;
  }
  inner_.OnProgress(event);
}

} // namespace bibmirror::ingest
