#pragma once

#include <functional>
#include <future>
#include <stop_token>
#include <string>

#include "internal/model/ingest_state.hpp"

namespace bibmirror::runtime {

/*
  A queued ingestion operation (bulk import or synchronization).

  run receives a token of the job's own stop source, which exists from
  submission on so a queued job can be cancelled before it starts; done
  is fulfilled exactly once with the terminal result.
*/
struct IngestionJob {
  std::string name;

  std::function<model::IngestResult(std::stop_token)> run;

  std::stop_source stop;

  std::promise<model::IngestResult> done;
};

} // namespace bibmirror::runtime
