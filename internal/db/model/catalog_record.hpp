#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/family.hpp"
#include "internal/util/time.hpp"

namespace bibmirror::db::model {

/*
  Common shape of every catalog row.

  IMPORTANT:
  - id is the local surrogate key assigned by storage (monotonic, never
    reused). Zero means "not stored yet".
  - remote_id is the upstream identifier and the only dedup key.
*/
struct CatalogRecord {
  int64_t  id        = 0;
  uint64_t remote_id = 0;

  // associated local content file, if the verification scanner linked one
  std::optional<int64_t> file_id;

  std::string language;
  std::string format;
};

struct NonFictionBookRecord : CatalogRecord {
  std::string title;
  std::string series;
  std::string authors;
  std::string year;
  std::string edition;
  std::string publisher;
  std::string pages;
  std::string identifier;
  uint64_t    size_in_bytes = 0;
  std::string md5;
  std::string cover_url;

  util::TimePoint added_at{};
  util::TimePoint last_modified_at{};
};

struct FictionBookRecord : CatalogRecord {
  std::string title;
  std::string authors;
  std::string series;
  std::string edition;
  std::string year;
  std::string publisher;
  std::string pages;
  std::string identifier;
  uint64_t    size_in_bytes = 0;
  std::string md5;
  std::string cover_url;

  util::TimePoint added_at{};
  util::TimePoint last_modified_at{};
};

struct SciMagArticleRecord : CatalogRecord {
  std::string doi;
  std::string title;
  std::string authors;
  std::string year;
  std::string volume;
  std::string issue;
  std::string first_page;
  std::string last_page;
  std::string journal;
  std::string issn;
  uint64_t    size_in_bytes = 0;
  std::string md5;

  // articles have no modification time; added_at drives change detection
  util::TimePoint added_at{};
};

} // namespace bibmirror::db::model
