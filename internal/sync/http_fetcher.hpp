#pragma once

#include <optional>
#include <stop_token>
#include <string>

namespace bibmirror::sync {

struct HttpResponse {
  long        status_code = 0;
  std::string body;
};

class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;

  // nullopt when stop was requested during the transfer. Transport
  // errors throw util::FetchFailed; HTTP status is left to the caller.
  virtual std::optional<HttpResponse> Get(const std::string& url, std::stop_token stop) = 0;
};

} // namespace bibmirror::sync
