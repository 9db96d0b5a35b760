#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/db/model/job_record.hpp"
#include "job_queue.hpp"

namespace ledcast::cache {
class CacheStore;
}
namespace ledcast::db {
class Repository;
}
namespace ledcast::pipeline {
class ConversionPipeline;
}

namespace ledcast::scheduler {

class SchedulerLock;

struct WorkerOptions {
  uint32_t max_attempts     = 3;
  uint64_t retry_backoff_ms = 2000;
  uint64_t lock_retry_ms    = 1000;
};

/*
  Single background thread that runs conversion jobs.

  Each job: acquire the scheduler lock (waiting out contention, never
  proceeding without it), mark running, convert, record outcomes,
  release. Fully failed jobs are re-queued with exponential backoff until
  max_attempts.
*/
class ConversionWorker {
 public:
  ConversionWorker(std::shared_ptr<JobQueue>                     queue,
                   std::shared_ptr<SchedulerLock>                lock,
                   std::shared_ptr<pipeline::ConversionPipeline> pipeline,
                   std::shared_ptr<db::Repository>               repository,
                   std::shared_ptr<cache::CacheStore>            cache,
                   WorkerOptions                                 options);
  ~ConversionWorker();

  // Reopens the queue, so a stopped worker can be started again.
  void Start();
  // Cancels the in-flight job (it goes back to queued) and joins.
  void Stop();

  // Runs one task on the calling thread. Returns the recorded job, or
  // nullopt if the source no longer exists or the worker stopped while
  // waiting for the lock.
  std::optional<db::model::JobRecord> Process(const ConversionTask& task);

  std::optional<std::string> InFlight() const;

 private:
  void Run();
  bool WaitForRetry();
  uint64_t BackoffMs(uint32_t attempts) const;
  // Fully failed attempt: queued with backoff (returns true) or failed.
  bool RetryOrFail(db::model::JobRecord& job) const;
  // False when the source row is gone.
  bool Record(const db::model::JobRecord& job);

  std::shared_ptr<JobQueue>                     queue_;
  std::shared_ptr<SchedulerLock>                lock_;
  std::shared_ptr<pipeline::ConversionPipeline> pipeline_;
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<cache::CacheStore>            cache_;
  WorkerOptions                                 options_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};

  mutable std::mutex         state_mutex_;
  std::condition_variable    stop_cv_;
  std::optional<std::string> in_flight_;
};

} // namespace ledcast::scheduler
