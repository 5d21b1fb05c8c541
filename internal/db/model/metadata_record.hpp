#pragma once

#include <string>

namespace bibmirror::db::model {

/*
  Database-wide metadata row.

  app_name distinguishes local mirrors from server-side databases;
  version is "major.minor" and must parse for the database to open.
*/
struct MetadataRecord {
  std::string app_name;
  std::string version;

  bool non_fiction_first_import_complete = false;
  bool fiction_first_import_complete     = false;
  bool scimag_first_import_complete      = false;
};

} // namespace bibmirror::db::model
