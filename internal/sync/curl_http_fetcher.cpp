#include "internal/sync/curl_http_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::sync {

namespace {

std::once_flag g_curl_init;

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* stop = static_cast<const std::stop_token*>(clientp);
  return stop->stop_requested() ? 1 : 0;
}

} // namespace

CurlHttpFetcher::CurlHttpFetcher(CurlOptions options) : options_(std::move(options)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::optional<HttpResponse> CurlHttpFetcher::Get(const std::string& url, std::stop_token stop) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::FetchFailed("curl_easy_init failed");
  }

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);
  if (!options_.user_agent.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  }
  if (!options_.proxy.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, options_.proxy.c_str());
  }

  const CURLcode res = curl_easy_perform(curl.get());

  if (res == CURLE_ABORTED_BY_CALLBACK || (res != CURLE_OK && stop.stop_requested())) {
    BIBMIRROR_LOG_DEBUG("http transfer cancelled", {observability::StringField("url", url)});
    return std::nullopt;
  }
  if (res != CURLE_OK) {
    throw util::FetchFailed("GET " + url + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

} // namespace bibmirror::sync
