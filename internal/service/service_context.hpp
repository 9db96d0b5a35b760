#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/geometry.hpp"

namespace ledcast::cache { class CacheStore; }
namespace ledcast::scheduler { class ConversionScheduler; }
namespace ledcast::stream { class StreamServer; }

namespace ledcast::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ledcast::cache::CacheStore>              cache;
  std::shared_ptr<ledcast::scheduler::ConversionScheduler> scheduler;
  // Optional; sessions and activity are empty without it.
  std::shared_ptr<ledcast::stream::StreamServer>           stream;
  std::vector<ledcast::model::TargetGeometry>              geometries;
  uint32_t                                                 items_per_page = 20;
};

} // namespace ledcast::service
