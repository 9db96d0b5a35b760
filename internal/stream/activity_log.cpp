#include "activity_log.hpp"

#include "internal/util/time.hpp"

namespace ledcast::stream {

ActivityLog::ActivityLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void ActivityLog::Record(ledcast::v1::ActivityEvent event) {
  if (event.time_ms() == 0) {
    event.set_time_ms(util::NowMs());
  }

  std::lock_guard lock(mutex_);
  events_.push_back(std::move(event));
  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

std::vector<ledcast::v1::ActivityEvent> ActivityLog::Recent(std::size_t limit) const {
  std::lock_guard lock(mutex_);

  const auto count = (limit == 0 || limit > events_.size()) ? events_.size() : limit;

  std::vector<ledcast::v1::ActivityEvent> out;
  out.reserve(count);
  for (auto it = events_.rbegin(); it != events_.rend() && out.size() < count; ++it) {
    out.push_back(*it);
  }
  return out;
}

std::size_t ActivityLog::Size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

} // namespace ledcast::stream
