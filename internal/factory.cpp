#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/catalog/table_catalog.hpp"
#include "internal/core/database_session.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/ingest/disk_space.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/curl_http_fetcher.hpp"
#include "internal/sync/json_api_delta_client.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::factory {

using bibmirror::model::Family;

namespace {

const std::string& EndpointFor(const bibmirror::runtime::config::SyncConfig& config, Family family) {
  switch (family) {
    case Family::kNonFiction:
      return config.non_fiction_url();
    case Family::kFiction:
      return config.fiction_url();
    case Family::kSciMag:
      return config.scimag_url();
  }
  throw util::InvalidState("unknown record family");
}

std::shared_ptr<db::Repository> BuildMemoryRepository() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto tx   = repo->Begin();
  auto r    = repo->UpsertMetadata(*tx, core::FreshMetadata());
  if (!r) throw util::StorageError("cannot initialize memory database: " + db::Describe(r));
  tx->Commit();
  return repo;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const bibmirror::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (!database.has_sqlite()) {
    return BuildMemoryRepository();
  }

  const auto& path   = database.sqlite().path();
  auto        opened = core::OpenDatabase(path, database.sqlite().wal_mode());

  if (opened.status == core::DatabaseStatus::kNotFound) {
    BIBMIRROR_LOG_INFO("database not found, creating", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(core::CreateDatabase(path, database.sqlite().wal_mode()));
  }
  if (opened.status != core::DatabaseStatus::kOpened) {
    throw std::runtime_error("cannot open database " + path + ": " + std::string(core::ToString(opened.status)));
  }
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(opened.db));
}

core::MirrorOptions BuildMirrorOptions(const bibmirror::runtime::config::RuntimeConfig& config) {
  const auto& ingest = config.ingest();

  core::MirrorOptions options;
  options.low_disk_space_threshold_bytes = ingest.low_disk_space_threshold_bytes();
  options.import_checkpoint_interval     = ingest.import_checkpoint_interval();
  options.sync_checkpoint_interval       = ingest.sync_checkpoint_interval();
  options.progress_interval              = std::chrono::milliseconds(ingest.progress_interval_ms());
  return options;
}

sync::DeltaSourceFactory BuildDeltaSources(const bibmirror::runtime::config::SyncConfig& config,
                                           std::shared_ptr<sync::HttpFetcher> fetcher) {
  return [config, fetcher](Family family, const model::WatermarkCursor& start) -> std::unique_ptr<sync::DeltaSource> {
    const auto& url = EndpointFor(config, family);
    if (url.empty()) return nullptr;

    const auto& table = catalog::TableCatalog::Default().ForFamily(family);

    sync::DeltaClientOptions options;
    options.url_template    = url;
    options.batch_size      = config.batch_size();
    options.id_field        = table.remote_id_column;
    options.timestamp_field = table.watermark_column;
    return std::make_unique<sync::JsonApiDeltaClient>(fetcher, std::move(options), start);
  };
}

/*
    Build full application dependency graph
*/
Application Build(const bibmirror::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  std::filesystem::path volume =
      config.database().has_sqlite() ? std::filesystem::path(config.database().sqlite().path()) : std::filesystem::current_path();
  auto disk = std::make_shared<ingest::FilesystemDiskSpaceProbe>(std::move(volume));

  // ------------------------------------------------------------------
  // Delta transport
  // ------------------------------------------------------------------
  const auto& sync_config = config.sync();
  auto        fetcher     = std::make_shared<sync::CurlHttpFetcher>(
      sync::CurlOptions{sync_config.timeout_seconds(), sync_config.user_agent(), sync_config.proxy()});

  // ------------------------------------------------------------------
  // Orchestrator + worker
  // ------------------------------------------------------------------
  app.mirror = std::make_shared<core::CatalogMirror>(app.repository, std::move(disk), BuildDeltaSources(sync_config, std::move(fetcher)),
                                                     BuildMirrorOptions(config));
  app.mirror->RefreshCounts();

  app.worker = std::make_shared<runtime::IngestionWorker>();
  app.worker->Start();

  return app;
}

} // namespace bibmirror::factory
