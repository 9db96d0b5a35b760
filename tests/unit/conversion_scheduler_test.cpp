#include "internal/scheduler/conversion_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/pipeline/conversion_pipeline.hpp"
#include "internal/scheduler/conversion_worker.hpp"
#include "internal/scheduler/scheduler_lock.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace ledcast;
using ledcast::testing::FakeDecoder;
using ledcast::testing::MakeCache;
using ledcast::testing::MakeSource;
using ledcast::testing::MakeTempDir;
using ledcast::testing::WriteFile;

struct Harness {
  std::filesystem::path                          source_dir;
  std::shared_ptr<db::memory::MemoryRepository>  repository;
  std::shared_ptr<cache::CacheStore>             cache;
  std::shared_ptr<FakeDecoder>                   decoder;
  std::unique_ptr<scheduler::ConversionScheduler> scheduler;
};

// Memory repository whose artifact reads can be switched to fail.
class FlakyRepository final : public db::Repository {
 public:
  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }
  db::Result UpsertSource(db::Transaction& tx, const db::model::SourceRecord& source) override {
    return inner_.UpsertSource(tx, source);
  }
  std::optional<db::model::SourceRecord> GetSource(db::Transaction& tx, const std::string& id) override {
    return inner_.GetSource(tx, id);
  }
  std::vector<db::model::SourceRecord> ListSources(db::Transaction& tx) override {
    return inner_.ListSources(tx);
  }
  db::Result DeleteSource(db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteSource(tx, id);
  }
  db::Result UpsertArtifact(db::Transaction& tx, const db::model::ArtifactRecord& artifact) override {
    return inner_.UpsertArtifact(tx, artifact);
  }
  std::optional<db::model::ArtifactRecord> GetArtifact(db::Transaction& tx, const std::string& source_id, const std::string& geometry,
                                                       const std::string& encoder_version) override {
    if (fail_artifact_reads) throw std::runtime_error("artifact index offline");
    return inner_.GetArtifact(tx, source_id, geometry, encoder_version);
  }
  std::vector<db::model::ArtifactRecord> ListArtifacts(db::Transaction& tx) override {
    return inner_.ListArtifacts(tx);
  }
  std::vector<db::model::ArtifactRecord> ListArtifactsForSource(db::Transaction& tx, const std::string& source_id) override {
    return inner_.ListArtifactsForSource(tx, source_id);
  }
  db::Result DeleteArtifact(db::Transaction& tx, const std::string& source_id, const std::string& geometry,
                            const std::string& encoder_version) override {
    return inner_.DeleteArtifact(tx, source_id, geometry, encoder_version);
  }
  db::Result TouchArtifact(db::Transaction& tx, const std::string& source_id, const std::string& geometry, const std::string& encoder_version,
                           uint64_t served_at_ms) override {
    return inner_.TouchArtifact(tx, source_id, geometry, encoder_version, served_at_ms);
  }
  db::Result UpsertJob(db::Transaction& tx, const db::model::JobRecord& job) override {
    return inner_.UpsertJob(tx, job);
  }
  std::optional<db::model::JobRecord> GetJob(db::Transaction& tx, const std::string& source_id) override {
    return inner_.GetJob(tx, source_id);
  }
  std::vector<db::model::JobRecord> ListJobs(db::Transaction& tx) override {
    return inner_.ListJobs(tx);
  }
  db::Result DeleteJob(db::Transaction& tx, const std::string& source_id) override {
    return inner_.DeleteJob(tx, source_id);
  }

  std::atomic<bool> fail_artifact_reads{false};

 private:
  db::memory::MemoryRepository inner_;
};

std::optional<db::model::JobRecord> JobOf(db::Repository& repository, const std::string& source_id) {
  auto tx = repository.Begin();
  return repository.GetJob(*tx, source_id);
}

scheduler::SchedulerOptions MakeOptions(const Harness& h, const std::filesystem::path& base, uint64_t retry_backoff_ms) {
  scheduler::SchedulerOptions options;
  options.source_dir              = h.source_dir;
  options.lock_path               = base / "scheduler.lock";
  options.extensions              = {"gif", "png"};
  options.worker.max_attempts     = 2;
  options.worker.retry_backoff_ms = retry_backoff_ms;
  options.worker.lock_retry_ms    = 10;
  return options;
}

Harness MakeHarness(const std::string& name, uint64_t retry_backoff_ms, cache::CacheOptions cache_options = {}) {
  const auto base = MakeTempDir(name);

  Harness h;
  h.source_dir = base / "uploads";
  std::filesystem::create_directories(h.source_dir);
  h.repository = std::make_shared<db::memory::MemoryRepository>();
  h.cache      = MakeCache(base / "cache", cache_options, h.repository);
  h.decoder    = std::make_shared<FakeDecoder>();

  auto pipe = std::make_shared<pipeline::ConversionPipeline>(h.decoder, h.cache, std::vector<model::TargetGeometry>{{32, 32}, {16, 16}},
                                                             codec::CodecOptions{});

  h.scheduler = std::make_unique<scheduler::ConversionScheduler>(MakeOptions(h, base, retry_backoff_ms), h.repository, h.cache, pipe);
  return h;
}

std::string IdOf(const std::string& content) {
  return util::Sha256Hex(content);
}

void TestScanConvertsAndRetriesToFailure() {
  auto h = MakeHarness("scheduler_scan", 0);
  WriteFile(h.source_dir / "one.gif", "one-bytes");
  WriteFile(h.source_dir / "two.png", "two-bytes");
  WriteFile(h.source_dir / "broken.gif", "broken-bytes");
  WriteFile(h.source_dir / "notes.txt", "ignored");
  WriteFile(h.source_dir / ".hidden.gif", "ignored too");

  const auto report = h.scheduler->ScanNow();
  assert(report.discovered == 3);
  assert(report.enqueued == 3);
  assert(h.scheduler->Counts().queued == 3);

  // broken.gif runs twice before it is marked failed
  assert(h.scheduler->DrainQueue() == 4);

  const auto one = h.scheduler->GetJob(IdOf("one-bytes"));
  assert(one->state == ledcast::v1::JOB_STATE_SUCCEEDED);
  assert(one->attempts == 1);
  assert(one->outcomes.size() == 2);
  assert(h.cache->Contains(IdOf("two-bytes"), "16x16"));

  const auto broken = h.scheduler->GetJob(IdOf("broken-bytes"));
  assert(broken->state == ledcast::v1::JOB_STATE_FAILED);
  assert(broken->attempts == 2);
  assert(broken->last_error.find("broken.gif") != std::string::npos);
  assert(broken->outcomes[0].error_kind == ledcast::v1::ERROR_KIND_DECODE);

  assert(h.scheduler->ListJobs(false).empty());
  assert(h.scheduler->ListJobs(true).size() == 3);
  assert(h.scheduler->Counts().failed == 1);

  // converted and failed sources are left alone by later scans
  const auto calls = h.decoder->calls.load();
  assert(h.scheduler->ScanNow().enqueued == 0);
  assert(h.scheduler->DrainQueue() == 0);
  assert(h.decoder->calls == calls);
}

void TestBackoffDelaysRetry() {
  auto h = MakeHarness("scheduler_backoff", 60000);
  WriteFile(h.source_dir / "broken.gif", "still-broken");

  h.scheduler->ScanNow();
  assert(h.scheduler->DrainQueue() == 1);

  const auto job = h.scheduler->GetJob(IdOf("still-broken"));
  assert(job->state == ledcast::v1::JOB_STATE_QUEUED);
  assert(job->attempts == 1);
  assert(job->not_before_ms > util::NowMs());
  assert(h.scheduler->Queue().Contains(IdOf("still-broken")));
  assert(h.scheduler->DrainQueue() == 0);

  // a rescan keeps the pending retry instead of queueing a second entry
  assert(h.scheduler->ScanNow().enqueued == 0);
  assert(h.scheduler->Queue().Size() == 1);
}

void TestReconvertClearsFailure() {
  auto h = MakeHarness("scheduler_reconvert", 0);
  WriteFile(h.source_dir / "broken.gif", "bad");
  h.scheduler->ScanNow();
  h.scheduler->DrainQueue();
  assert(h.scheduler->GetJob(IdOf("bad"))->state == ledcast::v1::JOB_STATE_FAILED);

  // same bytes under a decodable name
  std::filesystem::rename(h.source_dir / "broken.gif", h.source_dir / "fixed.gif");
  h.scheduler->ScanNow();
  assert(h.cache->GetSource(IdOf("bad"))->filename == "fixed.gif");

  const auto queued = h.scheduler->Reconvert(IdOf("bad"));
  assert(queued.state == ledcast::v1::JOB_STATE_QUEUED);
  assert(queued.attempts == 0);
  assert(h.scheduler->DrainQueue() == 1);
  assert(h.scheduler->GetJob(IdOf("bad"))->state == ledcast::v1::JOB_STATE_SUCCEEDED);

  bool not_found = false;
  try {
    h.scheduler->Reconvert(IdOf("never seen"));
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestDeleteAndVanishedSources() {
  auto h = MakeHarness("scheduler_delete", 0);
  WriteFile(h.source_dir / "keep.gif", "keep");
  WriteFile(h.source_dir / "drop.gif", "drop");
  WriteFile(h.source_dir / "gone.gif", "gone");
  h.scheduler->ScanNow();
  h.scheduler->DrainQueue();

  const auto deleted = h.scheduler->DeleteSource(IdOf("drop"));
  assert(deleted.artifacts_removed == 2);
  assert(deleted.file_removed);
  assert(!std::filesystem::exists(h.source_dir / "drop.gif"));
  assert(!h.cache->GetSource(IdOf("drop")).has_value());
  assert(!h.scheduler->GetJob(IdOf("drop")).has_value());

  std::filesystem::remove(h.source_dir / "gone.gif");
  const auto report = h.scheduler->ScanNow();
  assert(report.removed == 1);
  assert(!h.cache->GetSource(IdOf("gone")).has_value());
  assert(!h.scheduler->GetJob(IdOf("gone")).has_value());
  assert(h.cache->Contains(IdOf("keep"), "32x32"));

  bool not_found = false;
  try {
    h.scheduler->DeleteSource(IdOf("drop"));
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestEvictedArtifactsDoNotRequeue() {
  cache::CacheOptions bounded;
  bounded.limits.max_artifacts = 2;
  auto h = MakeHarness("scheduler_bounded", 0, bounded);
  WriteFile(h.source_dir / "a.gif", "a");
  WriteFile(h.source_dir / "b.gif", "b");
  WriteFile(h.source_dir / "c.gif", "c");

  assert(h.scheduler->ScanNow().enqueued == 3);
  assert(h.scheduler->DrainQueue() == 3);
  assert(h.cache->Stats().artifact_count == 2);
  for (const auto* content : {"a", "b", "c"}) {
    assert(h.scheduler->GetJob(IdOf(content))->state == ledcast::v1::JOB_STATE_SUCCEEDED);
  }

  // the cache has settled: later scans leave the evicted sources alone
  const auto calls = h.decoder->calls.load();
  for (int round = 0; round < 2; ++round) {
    assert(h.scheduler->ScanNow().enqueued == 0);
    assert(h.scheduler->DrainQueue() == 0);
  }
  assert(h.decoder->calls == calls);
  assert(h.cache->Stats().artifact_count == 2);

  // an explicit request brings an evicted source back
  std::string evicted;
  for (const auto* content : {"a", "b", "c"}) {
    if (!h.cache->Contains(IdOf(content), "16x16")) evicted = IdOf(content);
  }
  assert(!evicted.empty());
  h.scheduler->Reconvert(evicted);
  assert(h.scheduler->DrainQueue() == 1);
  assert(h.decoder->calls == calls + 1);
  assert(h.cache->Contains(evicted, "16x16"));
  assert(h.scheduler->GetJob(evicted)->state == ledcast::v1::JOB_STATE_SUCCEEDED);
  assert(h.scheduler->ScanNow().enqueued == 0);
}

void TestAddedGeometryRequeues() {
  const auto base = MakeTempDir("scheduler_geometry");
  auto       h    = MakeHarness("scheduler_geometry_first", 0);
  WriteFile(h.source_dir / "clip.gif", "clip");
  h.scheduler->ScanNow();
  assert(h.scheduler->DrainQueue() == 1);

  // restart with a third geometry over the same store
  h.scheduler.reset();
  auto wider = std::make_shared<pipeline::ConversionPipeline>(h.decoder, h.cache,
                                                              std::vector<model::TargetGeometry>{{32, 32}, {16, 16}, {53, 11}},
                                                              codec::CodecOptions{});
  scheduler::ConversionScheduler restarted(MakeOptions(h, base, 0), h.repository, h.cache, wider);

  assert(restarted.ScanNow().enqueued == 1);
  assert(restarted.DrainQueue() == 1);
  assert(h.cache->Contains(IdOf("clip"), "53x11"));
  assert(restarted.GetJob(IdOf("clip"))->outcomes.size() == 3);
  assert(restarted.ScanNow().enqueued == 0);
}

void TestAbortedConversionIsRecorded() {
  const auto base       = MakeTempDir("worker_aborted");
  auto       repository = std::make_shared<FlakyRepository>();
  auto       cache      = MakeCache(base / "cache", {}, repository);
  auto       pipe       = std::make_shared<pipeline::ConversionPipeline>(std::make_shared<FakeDecoder>(), cache,
                                                                       std::vector<model::TargetGeometry>{{16, 16}}, codec::CodecOptions{});
  auto       queue      = std::make_shared<scheduler::JobQueue>();

  scheduler::WorkerOptions options;
  options.max_attempts     = 2;
  options.retry_backoff_ms = 60000;
  options.lock_retry_ms    = 10;
  scheduler::ConversionWorker worker(queue, std::make_shared<scheduler::SchedulerLock>(base / "scheduler.lock"), pipe, repository, cache,
                                     options);

  const auto source = MakeSource("flaky", "flaky.gif");
  cache->RegisterSource(source);
  repository->fail_artifact_reads = true;

  auto run_expecting_error = [&] {
    bool threw = false;
    try {
      worker.Process(scheduler::ConversionTask{source.id, base / "flaky.gif", 0});
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("artifact index offline") != std::string::npos;
    }
    assert(threw);
    assert(!worker.InFlight().has_value());
  };

  // first abort: queued for a retry, never left running
  run_expecting_error();
  auto job = JobOf(*repository, source.id);
  assert(job->state == ledcast::v1::JOB_STATE_QUEUED);
  assert(job->attempts == 1);
  assert(job->last_error.find("artifact index offline") != std::string::npos);
  assert(job->not_before_ms > util::NowMs());
  assert(queue->Contains(source.id));

  // second abort exhausts the attempts
  queue->Remove(source.id);
  run_expecting_error();
  job = JobOf(*repository, source.id);
  assert(job->state == ledcast::v1::JOB_STATE_FAILED);
  assert(job->attempts == 2);
  assert(job->outcomes.size() == 1);
  assert(job->outcomes[0].geometry == "16x16");
  assert(job->outcomes[0].error_kind == ledcast::v1::ERROR_KIND_INTERNAL);
  assert(!queue->Contains(source.id));
}

void TestStoppedWorkerRestarts() {
  const auto base       = MakeTempDir("worker_restart");
  auto       repository = std::make_shared<db::memory::MemoryRepository>();
  auto       cache      = MakeCache(base / "cache", {}, repository);
  auto       pipe       = std::make_shared<pipeline::ConversionPipeline>(std::make_shared<FakeDecoder>(), cache,
                                                                       std::vector<model::TargetGeometry>{{16, 16}}, codec::CodecOptions{});
  auto       queue      = std::make_shared<scheduler::JobQueue>();
  scheduler::ConversionWorker worker(queue, std::make_shared<scheduler::SchedulerLock>(base / "scheduler.lock"), pipe, repository, cache,
                                     scheduler::WorkerOptions{});

  worker.Start();
  worker.Stop();
  worker.Start();

  const auto source = MakeSource("restart", "restart.gif");
  cache->RegisterSource(source);
  queue->Enqueue(scheduler::ConversionTask{source.id, base / "restart.gif", 0});

  bool done = false;
  for (int i = 0; i < 200 && !done; ++i) {
    const auto job = JobOf(*repository, source.id);
    done           = job && job->state == ledcast::v1::JOB_STATE_SUCCEEDED;
    if (!done) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  worker.Stop();
  assert(done);
  assert(cache->Contains(source.id, "16x16"));
}

void TestBackgroundWorkerConverts() {
  auto h = MakeHarness("scheduler_background", 0);
  WriteFile(h.source_dir / "live.gif", "live");
  h.scheduler->Start();

  bool done = false;
  for (int i = 0; i < 200 && !done; ++i) {
    const auto job = h.scheduler->GetJob(IdOf("live"));
    done           = job && job->state == ledcast::v1::JOB_STATE_SUCCEEDED;
    if (!done) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  h.scheduler->Stop();
  assert(done);
  assert(h.cache->Contains(IdOf("live"), "16x16"));
}

} // namespace

int main() {
  TestScanConvertsAndRetriesToFailure();
  TestBackoffDelaysRetry();
  TestReconvertClearsFailure();
  TestDeleteAndVanishedSources();
  TestEvictedArtifactsDoNotRequeue();
  TestAddedGeometryRequeues();
  TestAbortedConversionIsRecorded();
  TestStoppedWorkerRestarts();
  TestBackgroundWorkerConverts();

  std::cout << "ledcast_unit_conversion_scheduler: pass\n";
  return 0;
}
