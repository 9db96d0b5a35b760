#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/geometry.hpp"

namespace ledcast::cache { class CacheStore; }
namespace ledcast::pipeline { class ConversionPipeline; }
namespace ledcast::scheduler { class ConversionScheduler; }
namespace ledcast::service { class CatalogService; }
namespace ledcast::stream { class StreamServer; }

namespace ledcast::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process; Start() and Stop() order the background threads.
*/
struct Application {
  std::vector<model::TargetGeometry> geometries;

  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<cache::CacheStore>              cache;
  std::shared_ptr<pipeline::ConversionPipeline>   pipeline;
  std::shared_ptr<scheduler::ConversionScheduler> scheduler;
  std::shared_ptr<stream::StreamServer>           stream;
  std::shared_ptr<service::CatalogService>        catalog;

  // Scheduler first so clients find reclaimed state, then the listener.
  void Start();
  // Listener first, then the scheduler (abandons its in-flight job).
  void Stop();
};

/*
  BuildRepository

  The ONLY place allowed to know concrete DB types. Opens and migrates
  the metadata store; failures are fatal at startup.
*/
std::shared_ptr<db::Repository> BuildRepository(const ledcast::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: constructs the whole dependency graph from a
  validated config. Nothing is started.
*/
Application Build(const ledcast::runtime::config::RuntimeConfig& config);

} // namespace ledcast::factory
