#include "conversion_worker.hpp"

#include <algorithm>
#include <chrono>

#include "internal/cache/cache_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/conversion_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "scheduler_lock.hpp"

namespace ledcast::scheduler {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  throw std::runtime_error(context + ": " + result.message);
}

std::string FirstFailure(const pipeline::ConversionResult& result) {
  for (const auto& outcome : result.outcomes) {
    if (!outcome.ok) return outcome.geometry + ": " + outcome.reason;
  }
  return {};
}

} // namespace

ConversionWorker::ConversionWorker(std::shared_ptr<JobQueue>                     queue,
                                   std::shared_ptr<SchedulerLock>                lock,
                                   std::shared_ptr<pipeline::ConversionPipeline> pipeline,
                                   std::shared_ptr<db::Repository>               repository,
                                   std::shared_ptr<cache::CacheStore>            cache,
                                   WorkerOptions                                 options)
    : queue_(std::move(queue)),
      lock_(std::move(lock)),
      pipeline_(std::move(pipeline)),
      repository_(std::move(repository)),
      cache_(std::move(cache)),
      options_(options) {}

ConversionWorker::~ConversionWorker() {
  Stop();
}

void ConversionWorker::Start() {
  if (running_.exchange(true)) return;
  if (thread_.joinable()) thread_.join();
  cancel_ = false;
  queue_->Reopen();
  thread_ = std::thread(&ConversionWorker::Run, this);
}

void ConversionWorker::Stop() {
  {
    std::lock_guard lock(state_mutex_);
    running_ = false;
    cancel_  = true;
  }
  stop_cv_.notify_all();
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

std::optional<std::string> ConversionWorker::InFlight() const {
  std::lock_guard lock(state_mutex_);
  return in_flight_;
}

uint64_t ConversionWorker::BackoffMs(uint32_t attempts) const {
  const uint32_t exponent = attempts == 0 ? 0 : std::min<uint32_t>(attempts - 1, 20);
  return options_.retry_backoff_ms << exponent;
}

bool ConversionWorker::RetryOrFail(db::model::JobRecord& job) const {
  if (job.attempts >= options_.max_attempts) {
    job.state = ledcast::v1::JOB_STATE_FAILED;
    return false;
  }
  job.state         = ledcast::v1::JOB_STATE_QUEUED;
  job.not_before_ms = job.updated_at_ms + BackoffMs(job.attempts);
  return true;
}

bool ConversionWorker::Record(const db::model::JobRecord& job) {
  auto tx = repository_->Begin();
  if (!repository_->GetSource(*tx, job.source_id)) return false;
  ThrowIfDbError(repository_->UpsertJob(*tx, job), "record job outcome");
  tx->Commit();
  return true;
}

bool ConversionWorker::WaitForRetry() {
  std::unique_lock lock(state_mutex_);
  stop_cv_.wait_for(lock, std::chrono::milliseconds(options_.lock_retry_ms), [&] { return cancel_.load(); });
  return !cancel_.load();
}

void ConversionWorker::Run() {
  while (running_) {

    auto task = queue_->Dequeue();
    if (!task)
      break;

    try {
      Process(*task);
    }
    catch (const std::exception& e) {
      LEDCAST_LOG_ERROR("conversion job failed", {StringField("source", task->source_id), StringField("error", e.what())});
    }
  }
}

std::optional<db::model::JobRecord> ConversionWorker::Process(const ConversionTask& task) {
  std::optional<SchedulerLockGuard> guard;
  while (!guard) {
    try {
      guard.emplace(*lock_);
    } catch (const util::LockContention& e) {
      LEDCAST_LOG_DEBUG("scheduler lock busy", {StringField("source", task.source_id), StringField("reason", e.what())});
      if (!WaitForRetry()) {
        queue_->Enqueue(task);
        return std::nullopt;
      }
    }
  }

  const auto source = cache_->GetSource(task.source_id);
  if (!source) {
    auto tx      = repository_->Begin();
    auto deleted = repository_->DeleteJob(*tx, task.source_id);
    if (deleted) tx->Commit();
    return std::nullopt;
  }

  db::model::JobRecord job;
  {
    auto tx = repository_->Begin();
    if (auto existing = repository_->GetJob(*tx, task.source_id)) {
      job = std::move(*existing);
    }
    job.source_id       = task.source_id;
    job.state           = ledcast::v1::JOB_STATE_RUNNING;
    job.attempts += 1;
    job.encoder_version = cache_->EncoderVersion();
    job.updated_at_ms   = util::NowMs();
    job.not_before_ms   = 0;
    ThrowIfDbError(repository_->UpsertJob(*tx, job), "mark job running");
    tx->Commit();
  }

  {
    std::lock_guard lock(state_mutex_);
    in_flight_ = task.source_id;
  }
  LEDCAST_LOG_INFO("conversion started", {StringField("source", task.source_id), StringField("path", task.path.string()),
                                          IntField("attempt", job.attempts)});

  pipeline::ConversionResult result;
  try {
    result = pipeline_->Convert(*source, task.path, &cancel_);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(state_mutex_);
      in_flight_.reset();
    }
    job.updated_at_ms = util::NowMs();
    job.last_error    = std::string("conversion aborted: ") + e.what();
    job.outcomes.clear();
    for (const auto& geometry : pipeline_->Geometries()) {
      job.outcomes.push_back({geometry.Tag(), false, ledcast::v1::ERROR_KIND_INTERNAL, job.last_error});
    }
    const bool requeue = RetryOrFail(job);
    try {
      if (Record(job) && requeue) {
        queue_->Enqueue(ConversionTask{task.source_id, task.path, job.not_before_ms});
      }
    } catch (const std::exception& record_error) {
      LEDCAST_LOG_ERROR("cannot record aborted conversion", {StringField("source", task.source_id), StringField("error", record_error.what())});
    }
    throw;
  } catch (...) {
    std::lock_guard lock(state_mutex_);
    in_flight_.reset();
    throw;
  }
  {
    std::lock_guard lock(state_mutex_);
    in_flight_.reset();
  }

  job.outcomes      = result.outcomes;
  job.updated_at_ms = util::NowMs();
  job.last_error    = FirstFailure(result);

  bool requeue = false;
  if (result.AllSucceeded()) {
    job.state = ledcast::v1::JOB_STATE_SUCCEEDED;
  } else if (result.Abandoned()) {
    // not counted as an attempt
    job.state     = ledcast::v1::JOB_STATE_QUEUED;
    job.attempts -= 1;
  } else if (result.AllFailed()) {
    requeue = RetryOrFail(job);
  } else {
    job.state = ledcast::v1::JOB_STATE_PARTIAL;
  }

  if (!Record(job)) {
    // deleted while converting
    return std::nullopt;
  }

  if (requeue) {
    queue_->Enqueue(ConversionTask{task.source_id, task.path, job.not_before_ms});
  }

  LEDCAST_LOG_INFO("conversion recorded", {StringField("source", task.source_id), StringField("state", ledcast::v1::JobState_Name(job.state)),
                                           IntField("attempts", job.attempts),
                                           IntField("retry_in_ms", requeue ? static_cast<int64_t>(job.not_before_ms - job.updated_at_ms) : 0)});
  return job;
}

} // namespace ledcast::scheduler
