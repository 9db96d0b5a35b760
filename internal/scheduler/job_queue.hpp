#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "conversion_task.hpp"

namespace ledcast::scheduler {

/*
  Thread-safe blocking queue for the conversion worker.

  At most one entry per source. Tasks become eligible at not_before_ms;
  among eligible tasks the oldest enqueued runs first.
*/
class JobQueue {
 public:
  // Returns false if the source was already queued (its entry keeps the
  // earlier not_before_ms).
  bool Enqueue(const ConversionTask& task);

  // blocking wait for an eligible task
  std::optional<ConversionTask> Dequeue();

  // Eligible task if one is ready now.
  std::optional<ConversionTask> TryDequeue();

  bool Remove(const std::string& source_id);
  bool Contains(const std::string& source_id) const;
  std::size_t Size() const;

  // Wakes waiters; Dequeue returns nullopt until Reopen.
  void Shutdown();
  void Reopen();

 private:
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::deque<ConversionTask> queue_;
  bool                       shutdown_ = false;

  std::optional<ConversionTask> PopEligible(uint64_t now, uint64_t& earliest);
};

} // namespace ledcast::scheduler
