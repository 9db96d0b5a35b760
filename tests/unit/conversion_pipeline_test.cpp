#include "internal/pipeline/conversion_pipeline.hpp"

#include <cassert>
#include <iostream>

#include "support/fixtures.hpp"

namespace {

using namespace ledcast;
using ledcast::testing::FakeDecoder;
using ledcast::testing::MakeCache;
using ledcast::testing::MakeSource;
using ledcast::testing::MakeTempDir;

const std::vector<model::TargetGeometry> kGeometries = {{32, 32}, {16, 16}};

void TestConvertsEveryGeometryFromOneDecode() {
  const auto root    = MakeTempDir("pipeline_all");
  auto       cache   = MakeCache(root);
  auto       decoder = std::make_shared<FakeDecoder>();
  pipeline::ConversionPipeline pipe(decoder, cache, kGeometries, codec::CodecOptions{});

  auto source = MakeSource("spin", "spin.gif");
  source.kind = ledcast::v1::MEDIA_KIND_STATIC_IMAGE;
  cache->RegisterSource(source);

  const auto result = pipe.Convert(source, root / "spin.gif");
  assert(result.AllSucceeded());
  assert(result.outcomes.size() == 2);
  assert(result.outcomes[0].geometry == "32x32");
  assert(result.outcomes[1].geometry == "16x16");
  assert(decoder->calls == 1);

  auto hit = cache->Get(source.id, "16x16");
  assert(hit.has_value());
  assert(hit->frames.FrameCount() == 3);
  assert(hit->frames.durations_ms[0] == 50);

  // decoded kind replaces the sniffed one
  assert(cache->GetSource(source.id)->kind == ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE);

  // cached geometries are skipped without decoding again
  const auto again = pipe.Convert(source, root / "spin.gif");
  assert(again.AllSucceeded());
  assert(decoder->calls == 1);
}

void TestDecodeFailureFailsEveryGeometry() {
  const auto root  = MakeTempDir("pipeline_broken");
  auto       cache = MakeCache(root);
  pipeline::ConversionPipeline pipe(std::make_shared<FakeDecoder>(), cache, kGeometries, codec::CodecOptions{});

  const auto source = MakeSource("junk", "broken.gif");
  cache->RegisterSource(source);

  const auto result = pipe.Convert(source, root / "broken.gif");
  assert(result.AllFailed());
  assert(!result.Abandoned());
  for (const auto& outcome : result.outcomes) {
    assert(outcome.error_kind == ledcast::v1::ERROR_KIND_DECODE);
    assert(outcome.reason.find("broken.gif") != std::string::npos);
  }
  assert(cache->Stats().artifact_count == 0);
}

void TestOversizedGeometryFailsAlone() {
  const auto root = MakeTempDir("pipeline_partial");

  cache::CacheOptions options;
  options.limits.max_bytes = 5000;
  auto cache               = MakeCache(root, options);
  pipeline::ConversionPipeline pipe(std::make_shared<FakeDecoder>(), cache, kGeometries, codec::CodecOptions{});

  const auto source = MakeSource("wide", "wide.gif");
  cache->RegisterSource(source);

  const auto result = pipe.Convert(source, root / "wide.gif");
  assert(result.Succeeded() == 1);
  assert(!result.outcomes[0].ok);
  assert(result.outcomes[0].error_kind == ledcast::v1::ERROR_KIND_CAPACITY);
  assert(result.outcomes[1].ok);
  assert(cache->Contains(source.id, "16x16"));
  assert(!cache->Contains(source.id, "32x32"));
}

void TestCancelledConversionIsAbandoned() {
  const auto root    = MakeTempDir("pipeline_cancel");
  auto       cache   = MakeCache(root);
  auto       decoder = std::make_shared<FakeDecoder>();
  pipeline::ConversionPipeline pipe(decoder, cache, kGeometries, codec::CodecOptions{});

  const auto source = MakeSource("stop", "stop.gif");
  cache->RegisterSource(source);

  std::atomic<bool> cancel{true};
  const auto        result = pipe.Convert(source, root / "stop.gif", &cancel);
  assert(result.AllFailed());
  assert(result.Abandoned());
  assert(decoder->calls == 0);
}

} // namespace

int main() {
  TestConvertsEveryGeometryFromOneDecode();
  TestDecodeFailureFailsEveryGeometry();
  TestOversizedGeometryFailsAlone();
  TestCancelledConversionIsAbandoned();

  std::cout << "ledcast_unit_conversion_pipeline: pass\n";
  return 0;
}
