#include "job_queue.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>

#include "internal/util/time.hpp"

namespace ledcast::scheduler {

bool JobQueue::Enqueue(const ConversionTask& task) {
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const ConversionTask& queued) { return queued.source_id == task.source_id; });
    if (it != queue_.end()) {
      it->not_before_ms = std::min(it->not_before_ms, task.not_before_ms);
      it->path          = task.path;
      cv_.notify_one();
      return false;
    }
    queue_.push_back(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<ConversionTask> JobQueue::PopEligible(uint64_t now, uint64_t& earliest) {
  earliest = UINT64_MAX;
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (it->not_before_ms <= now) {
      ConversionTask task = std::move(*it);
      queue_.erase(it);
      return task;
    }
    earliest = std::min(earliest, it->not_before_ms);
  }
  return std::nullopt;
}

std::optional<ConversionTask> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (shutdown_) return std::nullopt;

    const auto now      = util::NowMs();
    uint64_t   earliest = 0;
    if (auto task = PopEligible(now, earliest)) return task;

    if (queue_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_for(lock, std::chrono::milliseconds(earliest - now));
    }
  }
}

std::optional<ConversionTask> JobQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  uint64_t        earliest = 0;
  return PopEligible(util::NowMs(), earliest);
}

bool JobQueue::Remove(const std::string& source_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(), [&](const ConversionTask& queued) { return queued.source_id == source_id; });
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

bool JobQueue::Contains(const std::string& source_id) const {
  std::lock_guard lock(mutex_);
  return std::any_of(queue_.begin(), queue_.end(), [&](const ConversionTask& queued) { return queued.source_id == source_id; });
}

std::size_t JobQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void JobQueue::Reopen() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
}

} // namespace ledcast::scheduler
