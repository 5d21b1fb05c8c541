#pragma once

#include <cstdint>
#include <string>

#include "internal/sync/http_fetcher.hpp"

namespace bibmirror::sync {

struct CurlOptions {
  uint32_t    timeout_seconds = 60;
  std::string user_agent;
  // empty means direct connection
  std::string proxy;
};

/*
  libcurl-backed GET. A transfer-progress callback aborts the transfer
  as soon as the stop token fires.
*/
class CurlHttpFetcher final : public HttpFetcher {
 public:
  explicit CurlHttpFetcher(CurlOptions options);

  std::optional<HttpResponse> Get(const std::string& url, std::stop_token stop) override;

 private:
  CurlOptions options_;
};

} // namespace bibmirror::sync
