#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/sync/delta_source.hpp"
#include "internal/sync/http_fetcher.hpp"

namespace bibmirror::sync {

struct DeltaClientOptions {
  // "{timenewer}", "{idnewer}" and "{limit}" are substituted per request
  std::string url_template;
  uint32_t    batch_size = 1000;

  // upstream field names of the dedup key and the change timestamp
  std::string id_field        = "id";
  std::string timestamp_field = "timelastmodified";
};

/*
  Delta source over the upstream JSON API.

  Each request asks for up to batch_size records past the cursor; the
  response is a JSON array of flat objects. Rows are re-sorted by
  (timestamp, id) and anything at or before the cursor is dropped, so a
  server that ignores the id tie-breaker cannot make the cursor regress.
  Non-2xx responses and malformed JSON throw util::FetchFailed.
*/
class JsonApiDeltaClient final : public DeltaSource {
 public:
  JsonApiDeltaClient(std::shared_ptr<HttpFetcher> fetcher, DeltaClientOptions options, model::WatermarkCursor start);

  DeltaBatch FetchNextBatch(std::stop_token stop) override;

  model::WatermarkCursor Cursor() const override {
    return cursor_;
  }

  // URL for the next request.
  std::string NextUrl() const;

 private:
  std::shared_ptr<HttpFetcher> fetcher_;
  DeltaClientOptions           options_;
  model::WatermarkCursor       cursor_;
};

} // namespace bibmirror::sync
