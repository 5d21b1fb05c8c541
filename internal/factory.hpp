#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/catalog_mirror.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/ingestion_worker.hpp"
#include "internal/sync/delta_source.hpp"
#include "internal/sync/http_fetcher.hpp"

namespace bibmirror::factory {

/*
  Application

  Owns all long-lived objects of a process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<core::CatalogMirror>      mirror;
  std::shared_ptr<runtime::IngestionWorker> worker;
};

/*
  Build

  Constructs the ingestion stack from runtime config and starts the
  worker thread.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and transport types.
*/
Application Build(const bibmirror::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const bibmirror::runtime::config::RuntimeConfig& config);

core::MirrorOptions BuildMirrorOptions(const bibmirror::runtime::config::RuntimeConfig& config);

// One JSON API client per family with a configured endpoint.
sync::DeltaSourceFactory BuildDeltaSources(const bibmirror::runtime::config::SyncConfig& config,
                                           std::shared_ptr<sync::HttpFetcher> fetcher);

} // namespace bibmirror::factory
