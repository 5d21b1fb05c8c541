#include "internal/ingest/family_traits.hpp"

#include "internal/ingest/presence_index.hpp"

namespace bibmirror::ingest {

namespace {

// Fields every family carries. Fails when the upstream id is unusable.
bool FillCommon(const RawRow& row, db::model::CatalogRecord& r) {
  auto remote_id = row.Unsigned("id");
  if (!remote_id || *remote_id == 0 || *remote_id > kMaxRemoteId) return false;

  r.remote_id = *remote_id;
  r.language  = row.Text("language");
  r.format    = row.Text("extension");
  return true;
}

} // namespace

std::optional<NonFictionTraits::Record> NonFictionTraits::FromRow(const RawRow& row) {
  Record r;
  if (!FillCommon(row, r)) return std::nullopt;

  r.title            = row.Text("title");
  r.series           = row.Text("series");
  r.authors          = row.Text("author");
  r.year             = row.Text("year");
  r.edition          = row.Text("edition");
  r.publisher        = row.Text("publisher");
  r.pages            = row.Text("pages");
  r.identifier       = row.Text("identifier");
  r.size_in_bytes    = row.Unsigned("filesize").value_or(0);
  r.md5              = row.Text("md5");
  r.cover_url        = row.Text("coverurl");
  r.added_at         = row.Timestamp("timeadded").value_or(util::TimePoint{});
  r.last_modified_at = row.Timestamp("timelastmodified").value_or(r.added_at);
  return r;
}

std::optional<FictionTraits::Record> FictionTraits::FromRow(const RawRow& row) {
  Record r;
  if (!FillCommon(row, r)) return std::nullopt;

  r.title            = row.Text("title");
  r.authors          = row.Text("author");
  r.series           = row.Text("series");
  r.edition          = row.Text("edition");
  r.year             = row.Text("year");
  r.publisher        = row.Text("publisher");
  r.pages            = row.Text("pages");
  r.identifier       = row.Text("identifier");
  r.size_in_bytes    = row.Unsigned("filesize").value_or(0);
  r.md5              = row.Text("md5");
  r.cover_url        = row.Text("coverurl");
  r.added_at         = row.Timestamp("timeadded").value_or(util::TimePoint{});
  r.last_modified_at = row.Timestamp("timelastmodified").value_or(r.added_at);
  return r;
}

std::optional<SciMagTraits::Record> SciMagTraits::FromRow(const RawRow& row) {
  Record r;
  if (!FillCommon(row, r)) return std::nullopt;

  r.doi           = row.Text("doi");
  r.title         = row.Text("title");
  r.authors       = row.Text("author");
  r.year          = row.Text("year");
  r.volume        = row.Text("volume");
  r.issue         = row.Text("issue");
  r.first_page    = row.Text("first_page");
  r.last_page     = row.Text("last_page");
  r.journal       = row.Text("journal");
  r.issn          = row.Text("issnp");
  r.size_in_bytes = row.Unsigned("filesize").value_or(0);
  r.md5           = row.Text("md5");
  r.added_at      = row.Timestamp("timeadded").value_or(util::TimePoint{});
  return r;
}

} // namespace bibmirror::ingest
