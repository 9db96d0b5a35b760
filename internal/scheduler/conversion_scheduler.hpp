#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "conversion_worker.hpp"
#include "internal/db/model/job_record.hpp"
#include "job_queue.hpp"
#include "scheduler_lock.hpp"
#include "source_scanner.hpp"

namespace ledcast::scheduler {

struct SchedulerOptions {
  std::filesystem::path    source_dir;
  std::filesystem::path    lock_path;
  uint32_t                 scan_interval_seconds = 300;
  WorkerOptions            worker;
  std::vector<std::string> extensions;
};

struct ScanReport {
  std::size_t discovered = 0;
  std::size_t enqueued   = 0;
  std::size_t removed    = 0;
  std::size_t reclaimed  = 0;
};

struct DeleteReport {
  std::size_t artifacts_removed = 0;
  bool        file_removed      = false;
};

struct JobCounts {
  std::size_t queued  = 0;
  std::size_t running = 0;
  std::size_t failed  = 0;
};

/*
  Owns discovery and conversion.

  A scan thread polls the watched directory every scan_interval_seconds
  (or at once on TriggerScan) and feeds the job queue; one worker drains
  it under the cross-process scheduler lock. Sole writer of job rows.
*/
class ConversionScheduler {
 public:
  ConversionScheduler(SchedulerOptions                              options,
                      std::shared_ptr<db::Repository>               repository,
                      std::shared_ptr<cache::CacheStore>            cache,
                      std::shared_ptr<pipeline::ConversionPipeline> pipeline);
  ~ConversionScheduler();

  // Reclaims cache orphans, starts the worker and the scan loop.
  void Start();
  void Stop();

  // Wakes the scan loop; returns immediately.
  void TriggerScan();

  // Synchronous discovery pass. Queues sources that are new, carry a job
  // from another encoder version, were interrupted, or lack an attempt at
  // a configured geometry. Evicted artifacts alone never re-queue.
  ScanReport ScanNow();

  // Clears failure state and queues the source. Throws util::NotFound.
  db::model::JobRecord Reconvert(const std::string& source_id);

  // Removes the watched file, cached artifacts and job row. Throws
  // util::NotFound.
  DeleteReport DeleteSource(const std::string& source_id);

  std::vector<db::model::JobRecord> ListJobs(bool include_finished);
  std::optional<db::model::JobRecord> GetJob(const std::string& source_id);
  JobCounts Counts();

  // Runs queued work on the calling thread until the queue is empty.
  // For tools and tests that do not Start() the worker.
  std::size_t DrainQueue();

  JobQueue& Queue() {
    return *queue_;
  }

 private:
  void ScanLoop();
  std::filesystem::path PathFor(const db::model::SourceRecord& source);
  void EnqueueJob(const std::string& source_id, const std::filesystem::path& path, uint64_t not_before_ms);
  bool HoldsEveryGeometry(const std::string& source_id) const;
  // A geometry added to the configuration after the job last ran.
  bool MissesConfiguredGeometry(const db::model::JobRecord& job) const;

  SchedulerOptions                              options_;
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<cache::CacheStore>            cache_;
  std::shared_ptr<pipeline::ConversionPipeline> pipeline_;

  SourceScanner                     scanner_;
  std::shared_ptr<JobQueue>         queue_;
  std::shared_ptr<SchedulerLock>    lock_;
  std::unique_ptr<ConversionWorker> worker_;

  std::mutex                                   scan_mutex_;
  std::map<std::string, std::filesystem::path> known_paths_;

  std::thread             scan_thread_;
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    scan_requested_ = false;
  bool                    stopping_       = false;
  bool                    started_        = false;
};

} // namespace ledcast::scheduler
