#include "conversion_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <system_error>

#include "internal/cache/cache_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/conversion_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledcast::scheduler {

using ledcast::v1::JobState;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  throw std::runtime_error(context + ": " + result.message);
}

bool Terminal(JobState state) {
  return state == ledcast::v1::JOB_STATE_SUCCEEDED || state == ledcast::v1::JOB_STATE_PARTIAL || state == ledcast::v1::JOB_STATE_FAILED;
}

} // namespace

ConversionScheduler::ConversionScheduler(SchedulerOptions                              options,
                                         std::shared_ptr<db::Repository>               repository,
                                         std::shared_ptr<cache::CacheStore>            cache,
                                         std::shared_ptr<pipeline::ConversionPipeline> pipeline)
    : options_(std::move(options)),
      repository_(std::move(repository)),
      cache_(std::move(cache)),
      pipeline_(std::move(pipeline)),
      scanner_(options_.source_dir, options_.extensions),
      queue_(std::make_shared<JobQueue>()),
      lock_(std::make_shared<SchedulerLock>(options_.lock_path)) {
  worker_ = std::make_unique<ConversionWorker>(queue_, lock_, pipeline_, repository_, cache_, options_.worker);
}

ConversionScheduler::~ConversionScheduler() {
  Stop();
}

void ConversionScheduler::Start() {
  if (started_) return;
  started_ = true;

  cache_->ReclaimOrphans();
  worker_->Start();
  scan_thread_ = std::thread(&ConversionScheduler::ScanLoop, this);

  LEDCAST_LOG_INFO("conversion scheduler started", {StringField("source_dir", options_.source_dir.string()),
                                                    StringField("lock", options_.lock_path.string()),
                                                    IntField("scan_interval_s", options_.scan_interval_seconds)});
}

void ConversionScheduler::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    if (stopping_) return;
    stopping_ = true;
  }
  wake_cv_.notify_all();
  if (scan_thread_.joinable()) scan_thread_.join();
  worker_->Stop();

  if (started_) LEDCAST_LOG_INFO("conversion scheduler stopped");
}

void ConversionScheduler::TriggerScan() {
  {
    std::lock_guard lock(wake_mutex_);
    scan_requested_ = true;
  }
  wake_cv_.notify_all();
}

void ConversionScheduler::ScanLoop() {
  std::unique_lock lock(wake_mutex_);
  while (!stopping_) {
    scan_requested_ = false;
    lock.unlock();
    try {
      ScanNow();
    } catch (const std::exception& e) {
      LEDCAST_LOG_ERROR("source scan failed", {StringField("source_dir", options_.source_dir.string()), StringField("error", e.what())});
    }
    lock.lock();
    wake_cv_.wait_for(lock, std::chrono::seconds(options_.scan_interval_seconds), [&] { return stopping_ || scan_requested_; });
  }
}

bool ConversionScheduler::HoldsEveryGeometry(const std::string& source_id) const {
  for (const auto& geometry : pipeline_->Geometries()) {
    if (!cache_->Contains(source_id, geometry.Tag())) return false;
  }
  return true;
}

bool ConversionScheduler::MissesConfiguredGeometry(const db::model::JobRecord& job) const {
  for (const auto& geometry : pipeline_->Geometries()) {
    const auto tag      = geometry.Tag();
    const bool attempted = std::any_of(job.outcomes.begin(), job.outcomes.end(), [&](const auto& outcome) { return outcome.geometry == tag; });
    if (!attempted) return true;
  }
  return false;
}

ScanReport ConversionScheduler::ScanNow() {
  std::lock_guard lock(scan_mutex_);
  ScanReport      report;

  const auto scanned = scanner_.Scan();
  report.discovered  = scanned.size();

  std::map<std::string, const ScannedSource*> by_id;
  for (const auto& item : scanned) {
    // identical bytes under two names: first path wins
    if (!by_id.emplace(item.record.id, &item).second) continue;

    auto record = item.record;
    if (auto existing = cache_->GetSource(record.id)) {
      if (existing->filename != record.filename) {
        record.kind = existing->kind;
        cache_->RegisterSource(record);
      }
    } else {
      cache_->RegisterSource(record);
      LEDCAST_LOG_INFO("source discovered", {StringField("source", record.id), StringField("filename", record.filename),
                                             IntField("bytes", static_cast<int64_t>(record.byte_size))});
    }
    known_paths_[record.id] = item.path;
  }

  for (const auto& listing : cache_->List()) {
    const auto& id = listing.source.id;
    if (by_id.contains(id)) continue;
    queue_->Remove(id);
    cache_->Delete(id);
    {
      auto tx      = repository_->Begin();
      auto deleted = repository_->DeleteJob(*tx, id);
      if (deleted) tx->Commit();
    }
    known_paths_.erase(id);
    ++report.removed;
    LEDCAST_LOG_INFO("source vanished, removed", {StringField("source", id), StringField("filename", listing.source.filename)});
  }

  const auto in_flight = worker_->InFlight();
  for (const auto& [id, item] : by_id) {
    if (in_flight && *in_flight == id) continue;

    uint64_t not_before_ms = 0;
    {
      auto tx  = repository_->Begin();
      auto job = repository_->GetJob(*tx, id);
      if (job && job->encoder_version == cache_->EncoderVersion()) {
        // Finished jobs stay finished for this identity. Artifacts evicted
        // since then come back through Reconvert, not through the scan.
        if (Terminal(job->state) && !MissesConfiguredGeometry(*job)) continue;
        if (job->state == ledcast::v1::JOB_STATE_QUEUED) not_before_ms = job->not_before_ms;
      } else if (!job && HoldsEveryGeometry(id)) {
        continue;
      }

      if (!job || job->state != ledcast::v1::JOB_STATE_QUEUED) {
        db::model::JobRecord fresh;
        fresh.source_id       = id;
        fresh.state           = ledcast::v1::JOB_STATE_QUEUED;
        fresh.encoder_version = cache_->EncoderVersion();
        fresh.updated_at_ms   = util::NowMs();
        if (job && job->encoder_version == cache_->EncoderVersion()) {
          fresh.attempts = job->state == ledcast::v1::JOB_STATE_RUNNING ? job->attempts : 0;
          fresh.outcomes = job->outcomes;
        }
        ThrowIfDbError(repository_->UpsertJob(*tx, fresh), "queue job");
        tx->Commit();
      }
    }
    if (queue_->Enqueue(ConversionTask{id, item->path, not_before_ms})) ++report.enqueued;
  }

  report.reclaimed = cache_->ReclaimOrphans();

  LEDCAST_LOG_INFO("source scan complete", {IntField("discovered", static_cast<int64_t>(report.discovered)),
                                            IntField("enqueued", static_cast<int64_t>(report.enqueued)),
                                            IntField("removed", static_cast<int64_t>(report.removed)),
                                            IntField("reclaimed", static_cast<int64_t>(report.reclaimed))});
  return report;
}

std::filesystem::path ConversionScheduler::PathFor(const db::model::SourceRecord& source) {
  std::lock_guard lock(scan_mutex_);
  if (auto it = known_paths_.find(source.id); it != known_paths_.end()) return it->second;
  return options_.source_dir / source.filename;
}

void ConversionScheduler::EnqueueJob(const std::string& source_id, const std::filesystem::path& path, uint64_t not_before_ms) {
  queue_->Enqueue(ConversionTask{source_id, path, not_before_ms});
}

db::model::JobRecord ConversionScheduler::Reconvert(const std::string& source_id) {
  const auto source = cache_->GetSource(source_id);
  if (!source) {
    throw util::NotFound("source " + source_id);
  }

  db::model::JobRecord job;
  job.source_id       = source_id;
  job.state           = ledcast::v1::JOB_STATE_QUEUED;
  job.encoder_version = cache_->EncoderVersion();
  job.updated_at_ms   = util::NowMs();
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertJob(*tx, job), "reconvert job");
    tx->Commit();
  }

  queue_->Remove(source_id);
  EnqueueJob(source_id, PathFor(*source), 0);
  LEDCAST_LOG_INFO("reconversion requested", {StringField("source", source_id)});
  return job;
}

DeleteReport ConversionScheduler::DeleteSource(const std::string& source_id) {
  const auto source = cache_->GetSource(source_id);
  if (!source) {
    throw util::NotFound("source " + source_id);
  }

  const auto path = PathFor(*source);
  queue_->Remove(source_id);

  DeleteReport report;
  report.artifacts_removed = cache_->Delete(source_id);

  {
    auto tx      = repository_->Begin();
    auto deleted = repository_->DeleteJob(*tx, source_id);
    if (deleted) tx->Commit();
  }

  std::error_code ec;
  report.file_removed = std::filesystem::remove(path, ec);
  if (ec) {
    LEDCAST_LOG_WARN("cannot remove source file", {StringField("path", path.string()), StringField("error", ec.message())});
  }

  {
    std::lock_guard lock(scan_mutex_);
    known_paths_.erase(source_id);
  }

  LEDCAST_LOG_INFO("source deleted on request", {StringField("source", source_id), IntField("artifacts", static_cast<int64_t>(report.artifacts_removed)),
                                                  observability::BoolField("file_removed", report.file_removed)});
  return report;
}

std::vector<db::model::JobRecord> ConversionScheduler::ListJobs(bool include_finished) {
  std::vector<db::model::JobRecord> jobs;
  {
    auto tx = repository_->Begin();
    jobs    = repository_->ListJobs(*tx);
  }
  if (include_finished) return jobs;

  std::vector<db::model::JobRecord> active;
  for (auto& job : jobs) {
    if (!Terminal(job.state)) active.push_back(std::move(job));
  }
  return active;
}

std::optional<db::model::JobRecord> ConversionScheduler::GetJob(const std::string& source_id) {
  auto tx = repository_->Begin();
  return repository_->GetJob(*tx, source_id);
}

JobCounts ConversionScheduler::Counts() {
  JobCounts counts;
  for (const auto& job : ListJobs(true)) {
    switch (job.state) {
      case ledcast::v1::JOB_STATE_QUEUED:
        ++counts.queued;
        break;
      case ledcast::v1::JOB_STATE_RUNNING:
        ++counts.running;
        break;
      case ledcast::v1::JOB_STATE_FAILED:
        ++counts.failed;
        break;
      default:
        break;
    }
  }
  return counts;
}

std::size_t ConversionScheduler::DrainQueue() {
  std::size_t processed = 0;
  while (auto task = queue_->TryDequeue()) {
    worker_->Process(*task);
    ++processed;
  }
  return processed;
}

} // namespace ledcast::scheduler
