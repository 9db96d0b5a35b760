#include "internal/service/catalog_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/pipeline/conversion_pipeline.hpp"
#include "internal/scheduler/conversion_scheduler.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace ledcast;
using namespace ledcast::v1;
using ledcast::testing::FakeDecoder;
using ledcast::testing::MakeCache;
using ledcast::testing::MakeTempDir;
using ledcast::testing::WriteFile;

struct Fixture {
  std::filesystem::path                           source_dir;
  std::shared_ptr<cache::CacheStore>              cache;
  std::shared_ptr<scheduler::ConversionScheduler> scheduler;
  std::unique_ptr<service::CatalogService>        catalog;
};

// Four sources, converted: alpha (served 3x), Beta, gamma, broken (failed).
Fixture BuildFixture(const std::string& name) {
  const auto base = MakeTempDir(name);
  const std::vector<model::TargetGeometry> geometries{{32, 32}, {16, 16}};

  Fixture f;
  f.source_dir    = base / "uploads";
  auto repository = std::make_shared<db::memory::MemoryRepository>();
  f.cache         = MakeCache(base / "cache", {}, repository);
  auto pipe       = std::make_shared<pipeline::ConversionPipeline>(std::make_shared<FakeDecoder>(), f.cache, geometries, codec::CodecOptions{});

  scheduler::SchedulerOptions options;
  options.source_dir              = f.source_dir;
  options.lock_path               = base / "scheduler.lock";
  options.extensions              = {"gif", "png"};
  options.worker.max_attempts     = 1;
  options.worker.lock_retry_ms    = 10;
  f.scheduler = std::make_shared<scheduler::ConversionScheduler>(options, repository, f.cache, pipe);

  WriteFile(f.source_dir / "alpha.gif", "a");
  WriteFile(f.source_dir / "Beta.gif", "bbbb");
  WriteFile(f.source_dir / "gamma.png", "gg");
  WriteFile(f.source_dir / "broken.gif", "broken-bytes");
  f.scheduler->ScanNow();
  f.scheduler->DrainQueue();

  const auto alpha = util::Sha256Hex("a");
  for (int i = 0; i < 3; ++i) assert(f.cache->Get(alpha, "16x16").has_value());

  service::ServiceContext ctx;
  ctx.cache          = f.cache;
  ctx.scheduler      = f.scheduler;
  ctx.geometries     = geometries;
  ctx.items_per_page = 3;
  f.catalog          = std::make_unique<service::CatalogService>(ctx);
  return f;
}

std::vector<std::string> Names(const ListSourcesResponse& resp) {
  std::vector<std::string> names;
  for (const auto& s : resp.sources()) names.push_back(s.display_name());
  return names;
}

void TestListingPagesAndSorts() {
  auto f = BuildFixture("catalog_list");

  ListSourcesRequest req;
  auto               resp = f.catalog->ListSources(req);
  assert(resp.total_count() == 4);
  assert(resp.page() == 1);
  assert(resp.page_size() == 3);
  assert(resp.total_pages() == 2);
  assert(resp.geometries_size() == 2);
  assert((Names(resp) == std::vector<std::string>{"alpha", "Beta", "broken"}));

  req.set_page(2);
  resp = f.catalog->ListSources(req);
  assert((Names(resp) == std::vector<std::string>{"gamma"}));

  req.set_page(9);
  assert(f.catalog->ListSources(req).sources_size() == 0);

  ListSourcesRequest by_size;
  by_size.set_page_size(10);
  by_size.set_sort(SORT_FIELD_SIZE);
  by_size.set_order(SORT_ORDER_DESC);
  assert((Names(f.catalog->ListSources(by_size)) == std::vector<std::string>{"broken", "Beta", "gamma", "alpha"}));

  ListSourcesRequest by_served;
  by_served.set_page_size(10);
  by_served.set_sort(SORT_FIELD_SERVED);
  by_served.set_order(SORT_ORDER_DESC);
  // ties stay alphabetical in either direction
  assert((Names(f.catalog->ListSources(by_served)) == std::vector<std::string>{"alpha", "Beta", "broken", "gamma"}));

  ListSourcesRequest search;
  search.set_search("BET");
  resp = f.catalog->ListSources(search);
  assert(resp.total_count() == 1);
  assert(resp.sources(0).filename() == "Beta.gif");

  search.set_search("nothing-matches");
  resp = f.catalog->ListSources(search);
  assert(resp.total_count() == 0);
  assert(resp.total_pages() == 1);
}

void TestSummaryCarriesArtifactAndJobState() {
  auto f = BuildFixture("catalog_summary");

  ListSourcesRequest req;
  req.set_page_size(10);
  const auto resp = f.catalog->ListSources(req);

  const auto& alpha = resp.sources(0);
  assert(alpha.job_state() == JOB_STATE_SUCCEEDED);
  assert(alpha.artifacts_size() == 2);
  assert(alpha.artifacts(0).geometry() == "32x32");
  assert(alpha.artifacts(0).ready());
  assert(alpha.artifacts(1).served_count() == 3);
  assert(alpha.served_count() == 3);
  assert(alpha.failure_reason().empty());

  const auto& broken = resp.sources(2);
  assert(broken.filename() == "broken.gif");
  assert(broken.job_state() == JOB_STATE_FAILED);
  assert(broken.failure_reason().find("broken.gif") != std::string::npos);
  assert(!broken.artifacts(0).ready());
  assert(!broken.artifacts(1).ready());
}

void TestMutationsAndErrors() {
  auto f = BuildFixture("catalog_mutations");

  bool invalid = false;
  try {
    f.catalog->ReconvertSource(ReconvertSourceRequest{});
  } catch (const util::InvalidState&) {
    invalid = true;
  }
  assert(invalid);

  bool not_found = false;
  try {
    DeleteSourceRequest req;
    req.set_source_id(util::Sha256Hex("missing"));
    f.catalog->DeleteSource(req);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  ReconvertSourceRequest reconvert;
  reconvert.set_source_id(util::Sha256Hex("broken-bytes"));
  const auto job = f.catalog->ReconvertSource(reconvert);
  assert(job.job().state() == JOB_STATE_QUEUED);

  ListJobsRequest active;
  auto            jobs = f.catalog->ListJobs(active);
  assert(jobs.jobs_size() == 1);
  assert(jobs.jobs(0).source_id() == reconvert.source_id());
  active.set_include_finished(true);
  assert(f.catalog->ListJobs(active).jobs_size() == 4);

  DeleteSourceRequest del;
  del.set_source_id(util::Sha256Hex("gg"));
  const auto deleted = f.catalog->DeleteSource(del);
  assert(deleted.artifacts_removed() == 2);
  assert(deleted.file_removed());
  assert(!std::filesystem::exists(f.source_dir / "gamma.png"));

  assert(f.catalog->TriggerScan(TriggerScanRequest{}).accepted());
}

void TestStatsAndActivityWithoutStreamServer() {
  auto f = BuildFixture("catalog_stats");

  const auto stats = f.catalog->GetStats(GetStatsRequest{});
  assert(stats.cache().artifact_count() == 6);
  assert(stats.cache().source_count() == 4);
  assert(stats.cache().max_artifacts() == 0);
  assert(stats.failed_jobs() == 1);
  assert(stats.queued_jobs() == 0);
  assert(stats.sessions_size() == 0);

  assert(f.catalog->GetRecentActivity(GetRecentActivityRequest{}).events_size() == 0);
}

} // namespace

int main() {
  TestListingPagesAndSorts();
  TestSummaryCarriesArtifactAndJobState();
  TestMutationsAndErrors();
  TestStatsAndActivityWithoutStreamServer();

  std::cout << "ledcast_unit_catalog_service: pass\n";
  return 0;
}
