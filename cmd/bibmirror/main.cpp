#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/database_session.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/progress.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using bibmirror::model::Family;
using bibmirror::model::IngestResult;
using bibmirror::model::IngestStatus;

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

namespace {

void PrintUsage() {
  std::cerr << "Usage: bibmirror <config.yaml> <command>\n"
            << "  create                                   create an empty catalog database\n"
            << "  import <dump> [--expect <family>]        import a bulk dump file\n"
            << "  sync <family>                            fetch upstream changes\n"
            << "  stats                                    print per-family counts\n"
            << "families: non-fiction, fiction, scimag" << std::endl;
}

// Waits for the worker, turning SIGINT/SIGTERM into cancellation of the
// submitted job, whether it already runs or still waits in the queue.
IngestResult Await(bibmirror::runtime::IngestionWorker& worker, std::future<IngestResult> future) {
  bool cancel_sent = false;
  while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
    if (g_interrupted && !cancel_sent) {
      const auto cancelled = worker.CancelAll();
      cancel_sent          = cancelled > 0;
      if (cancel_sent) BIBMIRROR_LOG_INFO("interrupt received, cancelling", {bibmirror::observability::UintField("jobs", cancelled)});
    }
  }
  return future.get();
}

int ExitCode(const IngestResult& result) {
  std::cout << "status=" << bibmirror::model::ToString(result.status) << " added=" << result.added << " updated=" << result.updated;
  if (result.status == IngestStatus::kError) {
    std::cout << " error=" << bibmirror::model::ToString(result.error) << " message=\"" << result.message << "\"";
  }
  std::cout << std::endl;
  return result.status == IngestStatus::kCompleted ? 0 : 2;
}

int RunCreate(const bibmirror::runtime::config::RuntimeConfig& config) {
  if (!config.database().has_sqlite()) {
    std::cerr << "create requires a sqlite database in the config" << std::endl;
    return 1;
  }

  const auto& path   = config.database().sqlite().path();
  const auto  opened = bibmirror::core::OpenDatabase(path, config.database().sqlite().wal_mode());
  if (opened.status != bibmirror::core::DatabaseStatus::kNotFound) {
    std::cout << "database " << path << " already exists: " << bibmirror::core::ToString(opened.status) << std::endl;
    return opened.status == bibmirror::core::DatabaseStatus::kOpened ? 0 : 2;
  }

  bibmirror::core::CreateDatabase(path, config.database().sqlite().wal_mode());
  std::cout << "created " << path << std::endl;
  return 0;
}

int RunStats(bibmirror::core::CatalogMirror& mirror) {
  for (const auto& family : mirror.GetDatabaseStats().families) {
    std::cout << bibmirror::model::ToString(family.family) << ": " << family.count;
    if (family.last_update) std::cout << " (last update " << bibmirror::util::FormatTimestamp(*family.last_update) << ")";
    std::cout << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    PrintUsage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              command     = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  // ------------------------------------------------------------
  // Parse command line
  // ------------------------------------------------------------
  std::string           dump_path;
  std::optional<Family> family;

  if (command == "import") {
    if (args.empty()) {
      PrintUsage();
      return 1;
    }
    dump_path = args[0];
    if (args.size() == 3 && args[1] == "--expect") {
      family = bibmirror::model::FamilyFromString(args[2]);
      if (!family) {
        std::cerr << "unknown family: " << args[2] << std::endl;
        return 1;
      }
    } else if (args.size() != 1) {
      PrintUsage();
      return 1;
    }
  } else if (command == "sync") {
    if (args.size() != 1 || !(family = bibmirror::model::FamilyFromString(args[0]))) {
      PrintUsage();
      return 1;
    }
  } else if (command != "create" && command != "stats") {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = bibmirror::config::ConfigLoader::LoadFromYaml(config_path);

    bibmirror::observability::InitializeLogging(config);

    if (command == "create") {
      const int code = RunCreate(config);
      bibmirror::observability::ShutdownLogging();
      return code;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = bibmirror::factory::Build(config);

    if (command == "stats") {
      const int code = RunStats(*app.mirror);
      app.worker->Stop();
      bibmirror::observability::ShutdownLogging();
      return code;
    }

    // Register signal handlers before submitting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto sink   = std::make_shared<bibmirror::ingest::LoggingProgressSink>();
    auto mirror = app.mirror;

    std::future<IngestResult> future;
    if (command == "import") {
      BIBMIRROR_LOG_INFO("importing dump", {bibmirror::observability::StringField("path", dump_path)});
      future = app.worker->Submit("import", [mirror, sink, dump_path, family](std::stop_token stop) {
        return mirror->ImportDump(dump_path, family, *sink, stop);
      });
    } else {
      BIBMIRROR_LOG_INFO("synchronizing", {bibmirror::observability::StringField("family", bibmirror::model::ToString(*family))});
      future = app.worker->Submit("sync", [mirror, sink, family](std::stop_token stop) {
        return mirror->Synchronize(*family, *sink, stop);
      });
    }

    const auto result = Await(*app.worker, std::move(future));
    app.worker->Stop();

    const int code = ExitCode(result);
    bibmirror::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    BIBMIRROR_LOG_ERROR("Fatal error", {bibmirror::observability::StringField("error", e.what())});
    bibmirror::observability::ShutdownLogging();
    return 2;
  }
}
