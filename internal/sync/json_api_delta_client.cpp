#include "internal/sync/json_api_delta_client.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

#include "internal/ingest/cancellation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::sync {

namespace {

std::string PercentEncode(const std::string& s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
  for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
}

std::optional<std::string> ScalarText(const google::protobuf::Value& v) {
  switch (v.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return v.string_value();
    case google::protobuf::Value::kNumberValue: {
      const double d = v.number_value();
      if (std::trunc(d) == d && std::fabs(d) < 9.0e15) return std::to_string(static_cast<int64_t>(d));
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", d);
      return std::string(buf);
    }
    case google::protobuf::Value::kBoolValue:
      return std::string(v.bool_value() ? "1" : "0");
    default:
      return std::nullopt;
  }
}

struct KeyedRow {
  model::WatermarkCursor key;
  ingest::RawRow         row;
};

} // namespace

JsonApiDeltaClient::JsonApiDeltaClient(std::shared_ptr<HttpFetcher> fetcher, DeltaClientOptions options,
                                       model::WatermarkCursor start)
    : fetcher_(std::move(fetcher)), options_(std::move(options)), cursor_(start) {
}

std::string JsonApiDeltaClient::NextUrl() const {
  std::string url = options_.url_template;
  ReplaceAll(url, "{timenewer}", PercentEncode(util::FormatTimestamp(cursor_.timestamp)));
  ReplaceAll(url, "{idnewer}", std::to_string(cursor_.remote_id));
  ReplaceAll(url, "{limit}", std::to_string(options_.batch_size));
  return url;
}

DeltaBatch JsonApiDeltaClient::FetchNextBatch(std::stop_token stop) {
  if (ingest::CancellationRequested(stop, "delta fetch")) return {DeltaBatch::Status::kCancelled, {}};

  const auto url      = NextUrl();
  auto       response = fetcher_->Get(url, stop);
  if (!response) return {DeltaBatch::Status::kCancelled, {}};

  if (response->status_code < 200 || response->status_code >= 300) {
    throw util::FetchFailed("GET " + url + " returned HTTP " + std::to_string(response->status_code));
  }

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(response->body, &list);
  if (!status.ok()) {
    throw util::FetchFailed("malformed delta response: " + std::string(status.message()));
  }

  std::vector<KeyedRow> keyed;
  keyed.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStructValue) {
      throw util::FetchFailed("malformed delta response: array element is not an object");
    }

    ingest::RawRow row;
    for (const auto& [name, field] : value.struct_value().fields()) {
      row.Set(name, ScalarText(field));
    }

    auto id        = row.Unsigned(options_.id_field);
    auto timestamp = row.Timestamp(options_.timestamp_field);
    if (!id || !timestamp) {
      BIBMIRROR_LOG_WARN("skipping delta record without id or timestamp", {observability::StringField("url", url)});
      continue;
    }

    model::WatermarkCursor key{*timestamp, *id};
    if (key <= cursor_) continue;
    keyed.push_back({key, std::move(row)});
  }

  std::stable_sort(keyed.begin(), keyed.end(), [](const KeyedRow& a, const KeyedRow& b) { return a.key < b.key; });

  if (keyed.empty()) return {DeltaBatch::Status::kExhausted, {}};

  DeltaBatch batch{DeltaBatch::Status::kBatch, {}};
  batch.rows.reserve(keyed.size());
  for (auto& k : keyed) {
    batch.rows.push_back(std::move(k.row));
  }
  cursor_.Advance(keyed.back().key);

  BIBMIRROR_LOG_DEBUG("delta batch downloaded",
                      {observability::UintField("rows", batch.rows.size()),
                       observability::StringField("cursor_time", util::FormatTimestamp(cursor_.timestamp)),
                       observability::UintField("cursor_id", cursor_.remote_id)});
  return batch;
}

} // namespace bibmirror::sync
