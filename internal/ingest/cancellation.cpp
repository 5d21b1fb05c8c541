#include "internal/ingest/cancellation.hpp"

#include "internal/observability/logging.hpp"

namespace bibmirror::ingest {

bool CancellationRequested(const std::stop_token& token, std::string_view where) {
  if (!token.stop_requested()) return false;

  BIBMIRROR_LOG_DEBUG("cancellation requested", {observability::StringField("at", where)});
  return true;
}

} // namespace bibmirror::ingest
