#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <vector>

#include "internal/codec/frame_codec.hpp"
#include "internal/codec/media_decoder.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/model/geometry.hpp"

namespace ledcast::cache {
class CacheStore;
}

namespace ledcast::pipeline {

using GeometryOutcome = db::model::GeometryOutcomeRecord;

struct ConversionResult {
  // One entry per configured geometry, in configuration order.
  std::vector<GeometryOutcome> outcomes;

  std::size_t Succeeded() const;
  bool        AllSucceeded() const {
    return Succeeded() == outcomes.size();
  }
  bool AllFailed() const {
    return Succeeded() == 0;
  }
  // Every failure was a cancellation.
  bool Abandoned() const;
};

/*
  Decode once, encode per geometry, store through the cache.

  Geometries are independent: a failure for one never aborts the others.
  Geometries the cache already holds at the current encoder version are
  skipped and reported as succeeded.
*/
class ConversionPipeline {
 public:
  ConversionPipeline(std::shared_ptr<codec::MediaDecoder> decoder,
                     std::shared_ptr<cache::CacheStore>   cache,
                     std::vector<model::TargetGeometry>   geometries,
                     codec::CodecOptions                  options);

  // cancel is polled between geometries; unfinished ones are reported as
  // abandoned.
  ConversionResult Convert(const db::model::SourceRecord& source,
                           const std::filesystem::path&   path,
                           const std::atomic<bool>*       cancel = nullptr);

  const std::vector<model::TargetGeometry>& Geometries() const {
    return geometries_;
  }

 private:
  std::shared_ptr<codec::MediaDecoder> decoder_;
  std::shared_ptr<cache::CacheStore>   cache_;
  std::vector<model::TargetGeometry>   geometries_;
  codec::CodecOptions                  options_;
};

} // namespace ledcast::pipeline
