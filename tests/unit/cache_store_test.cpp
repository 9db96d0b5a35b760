#include "internal/cache/cache_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>

#include "support/fixtures.hpp"

namespace {

using namespace ledcast;
using ledcast::testing::MakeCache;
using ledcast::testing::MakeSequence;
using ledcast::testing::MakeSource;
using ledcast::testing::MakeTempDir;

const model::TargetGeometry k32{32, 32};
const model::TargetGeometry k16{16, 16};

void TestPutGetRoundTripAndServeCount() {
  const auto root  = MakeTempDir("cache_put_get");
  auto       cache = MakeCache(root);
  const auto src   = MakeSource("fire", "fire.gif");
  cache->RegisterSource(src);

  const auto frames = MakeSequence(k32, 3, 40, true, 7);
  const auto stored = cache->Put(src.id, frames);
  assert(stored.frame_count == 3);
  assert(stored.encoder_version == ledcast::testing::kTestEncoderVersion);
  assert(std::filesystem::exists(root / stored.path));

  // same key is a no-op
  const auto again = cache->Put(src.id, frames);
  assert(again.path == stored.path);
  assert(cache->Stats().artifact_count == 1);

  assert(cache->Contains(src.id, "32x32"));
  assert(!cache->Contains(src.id, "16x16"));

  auto hit = cache->Get(src.id, "32x32");
  assert(hit.has_value());
  assert(hit->frames.frames == frames.frames);
  assert(hit->frames.durations_ms == frames.durations_ms);
  assert(hit->record.served_count == 1);
  assert(hit->record.last_served_ms > 0);

  hit = cache->Get(src.id, "32x32");
  assert(hit->record.served_count == 2);

  assert(!cache->Get(src.id, "16x16").has_value());
}

void TestFindSourceSelectors() {
  const auto root  = MakeTempDir("cache_find");
  auto       cache = MakeCache(root);
  const auto src   = MakeSource("rainbow-bytes", "Rainbow Wave.gif");
  cache->RegisterSource(src);

  assert(cache->FindSource(src.id)->id == src.id);
  assert(cache->FindSource(src.id.substr(0, 10))->id == src.id);
  assert(!cache->FindSource(src.id.substr(0, 4)).has_value());
  assert(cache->FindSource("Rainbow Wave")->id == src.id);
  assert(cache->FindSource("Rainbow Wave.gif")->id == src.id);
  assert(!cache->FindSource("nope").has_value());
  assert(!cache->FindSource("").has_value());
}

void TestLeastRecentlyServedIsEvicted() {
  const auto root = MakeTempDir("cache_evict");

  cache::CacheOptions options;
  options.limits.max_artifacts = 2;
  auto cache                   = MakeCache(root, options);

  const auto a = MakeSource("a", "a.gif");
  const auto b = MakeSource("b", "b.gif");
  const auto c = MakeSource("c", "c.gif");
  for (const auto& s : {a, b, c}) cache->RegisterSource(s);

  cache->Put(a.id, MakeSequence(k16, 1));
  cache->Put(b.id, MakeSequence(k16, 1));
  assert(cache->Get(a.id, "16x16").has_value());

  std::string b_path;
  for (const auto& artifact : cache->ListArtifacts("16x16")) {
    if (artifact.source_id == b.id) b_path = artifact.path;
  }
  assert(!b_path.empty());
  cache->Put(c.id, MakeSequence(k16, 1));

  assert(cache->Contains(a.id, "16x16"));
  assert(!cache->Contains(b.id, "16x16"));
  assert(cache->Contains(c.id, "16x16"));
  assert(!std::filesystem::exists(root / b_path));

  const auto stats = cache->Stats();
  assert(stats.artifact_count == 2);
  assert(stats.evictions == 1);
  assert(stats.source_count == 3);
}

void TestArtifactLargerThanCacheIsRejected() {
  const auto root = MakeTempDir("cache_capacity");

  cache::CacheOptions options;
  options.limits.max_bytes = 64;
  auto cache               = MakeCache(root, options);
  const auto src           = MakeSource("big", "big.gif");
  cache->RegisterSource(src);

  bool rejected = false;
  try {
    cache->Put(src.id, MakeSequence(k32, 2));
  } catch (const util::CapacityError&) {
    rejected = true;
  }
  assert(rejected);
  assert(cache->Stats().artifact_count == 0);
  assert(cache->ReclaimOrphans() == 0);
}

void TestPutRequiresRegisteredSource() {
  const auto root  = MakeTempDir("cache_unregistered");
  auto       cache = MakeCache(root);

  bool not_found = false;
  try {
    cache->Put(util::Sha256Hex("ghost"), MakeSequence(k16, 1));
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestDeleteRemovesRowsAndFiles() {
  const auto root  = MakeTempDir("cache_delete");
  auto       cache = MakeCache(root);
  const auto src   = MakeSource("del", "del.png");
  cache->RegisterSource(src);
  const auto r1 = cache->Put(src.id, MakeSequence(k16, 1));
  const auto r2 = cache->Put(src.id, MakeSequence(k32, 1));

  assert(cache->Delete(src.id) == 2);
  assert(!cache->GetSource(src.id).has_value());
  assert(!std::filesystem::exists(root / r1.path));
  assert(!std::filesystem::exists(root / r2.path));

  bool not_found = false;
  try {
    cache->Delete(src.id);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestEncoderVersionBumpInvalidatesArtifacts() {
  const auto root       = MakeTempDir("cache_version");
  auto       repository = std::make_shared<db::memory::MemoryRepository>();
  auto       v1         = MakeCache(root, {}, repository);
  const auto src        = MakeSource("ver", "ver.gif");
  v1->RegisterSource(src);
  const auto old_record = v1->Put(src.id, MakeSequence(k16, 2));

  auto v2 = std::make_shared<cache::CacheStore>(repository, std::make_shared<storage::DiskArtifactStore>(root), "test-encoder-2",
                                                cache::CacheOptions{});
  assert(!v2->Contains(src.id, "16x16"));
  assert(!v2->Get(src.id, "16x16").has_value());
  assert(v2->List().at(0).artifacts.empty());

  const auto new_record = v2->Put(src.id, MakeSequence(k16, 2));
  assert(new_record.path != old_record.path);
  assert(!std::filesystem::exists(root / old_record.path));
  assert(v2->Stats().artifact_count == 1);
}

void TestCorruptArtifactIsDroppedOnRead() {
  const auto root  = MakeTempDir("cache_corrupt");
  auto       cache = MakeCache(root);
  const auto src   = MakeSource("corrupt", "corrupt.gif");
  cache->RegisterSource(src);
  const auto record = cache->Put(src.id, MakeSequence(k16, 2));

  ledcast::testing::WriteFile(root / record.path, "garbage");

  assert(!cache->Get(src.id, "16x16").has_value());
  assert(!cache->Contains(src.id, "16x16"));
  assert(!std::filesystem::exists(root / record.path));
}

void TestReclaimOrphans() {
  const auto root  = MakeTempDir("cache_orphans");
  auto       cache = MakeCache(root);
  const auto a     = MakeSource("orphan-a", "a.gif");
  const auto b     = MakeSource("orphan-b", "b.gif");
  cache->RegisterSource(a);
  cache->RegisterSource(b);
  const auto kept    = cache->Put(a.id, MakeSequence(k16, 1));
  const auto missing = cache->Put(b.id, MakeSequence(k16, 1));

  std::filesystem::remove(root / missing.path);
  ledcast::testing::WriteFile(root / "16x16" / "leftover.lcf.tmp", "partial");
  ledcast::testing::WriteFile(root / "ledcast.sqlite3", "not an artifact");

  assert(cache->ReclaimOrphans() == 2);
  assert(cache->Contains(a.id, "16x16"));
  assert(!cache->Contains(b.id, "16x16"));
  assert(std::filesystem::exists(root / kept.path));
  assert(!std::filesystem::exists(root / "16x16" / "leftover.lcf.tmp"));
  assert(std::filesystem::exists(root / "ledcast.sqlite3"));
  assert(cache->ReclaimOrphans() == 0);
}

} // namespace

int main() {
  TestPutGetRoundTripAndServeCount();
  TestFindSourceSelectors();
  TestLeastRecentlyServedIsEvicted();
  TestArtifactLargerThanCacheIsRejected();
  TestPutRequiresRegisteredSource();
  TestDeleteRemovesRowsAndFiles();
  TestEncoderVersionBumpInvalidatesArtifacts();
  TestCorruptArtifactIsDroppedOnRead();
  TestReclaimOrphans();

  std::cout << "ledcast_unit_cache_store: pass\n";
  return 0;
}
