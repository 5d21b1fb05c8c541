#pragma once

#include <stop_token>
#include <string_view>

namespace bibmirror::ingest {

// Single cancellation check used at every loop head of the pipeline.
// Logs where the stop was observed.
bool CancellationRequested(const std::stop_token& token, std::string_view where);

} // namespace bibmirror::ingest
