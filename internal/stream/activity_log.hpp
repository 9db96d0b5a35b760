#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "ledcast/v1.hpp"

namespace ledcast::stream {

/*
  Bounded ring of recent session events, newest kept.
*/
class ActivityLog {
 public:
  explicit ActivityLog(std::size_t capacity);

  void Record(ledcast::v1::ActivityEvent event);

  // Newest first; limit 0 returns everything held.
  std::vector<ledcast::v1::ActivityEvent> Recent(std::size_t limit = 0) const;

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  std::size_t                            capacity_;
  mutable std::mutex                     mutex_;
  std::deque<ledcast::v1::ActivityEvent> events_;
};

} // namespace ledcast::stream
