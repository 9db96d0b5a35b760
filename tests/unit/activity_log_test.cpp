#include "internal/stream/activity_log.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using ledcast::stream::ActivityLog;

ledcast::v1::ActivityEvent Event(uint64_t session_id, ledcast::v1::ActivityKind kind) {
  ledcast::v1::ActivityEvent event;
  event.set_session_id(session_id);
  event.set_kind(kind);
  return event;
}

void TestRecentIsNewestFirstAndBounded() {
  ActivityLog log(3);
  for (uint64_t i = 1; i <= 5; ++i) {
    log.Record(Event(i, ledcast::v1::ACTIVITY_KIND_CONNECT));
  }

  assert(log.Size() == 3);
  const auto events = log.Recent();
  assert(events.size() == 3);
  assert(events[0].session_id() == 5);
  assert(events[1].session_id() == 4);
  assert(events[2].session_id() == 3);

  const auto limited = log.Recent(2);
  assert(limited.size() == 2 && limited[0].session_id() == 5);
}

void TestRecordStampsMissingTime() {
  ActivityLog log(4);
  log.Record(Event(1, ledcast::v1::ACTIVITY_KIND_DISCONNECT));

  auto stamped = Event(2, ledcast::v1::ACTIVITY_KIND_ERROR);
  stamped.set_time_ms(42);
  log.Record(stamped);

  const auto events = log.Recent();
  assert(events[0].time_ms() == 42);
  assert(events[1].time_ms() > 0);
}

void TestConcurrentWritersKeepCapacity() {
  ActivityLog              log(64);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&log, t] {
      for (int i = 0; i < 200; ++i) {
        log.Record(Event(static_cast<uint64_t>(t * 1000 + i), ledcast::v1::ACTIVITY_KIND_STREAM));
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(log.Size() == 64);
  assert(log.Recent(0).size() == 64);
}

} // namespace

int main() {
  TestRecentIsNewestFirstAndBounded();
  TestRecordStampsMissingTime();
  TestConcurrentWritersKeepCapacity();

  std::cout << "ledcast_unit_activity_log: pass\n";
  return 0;
}
