#include "internal/scheduler/job_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/time.hpp"

namespace {

using ledcast::scheduler::ConversionTask;
using ledcast::scheduler::JobQueue;

ConversionTask Task(const std::string& id, uint64_t not_before_ms = 0) {
  return ConversionTask{id, "/media/" + id + ".gif", not_before_ms};
}

void TestFifoAndDedupe() {
  JobQueue queue;
  assert(queue.Enqueue(Task("a")));
  assert(queue.Enqueue(Task("b")));
  assert(!queue.Enqueue(Task("a")));
  assert(queue.Size() == 2);
  assert(queue.Contains("a"));

  assert(queue.TryDequeue()->source_id == "a");
  assert(queue.TryDequeue()->source_id == "b");
  assert(!queue.TryDequeue().has_value());
}

void TestBackoffDefersTask() {
  JobQueue   queue;
  const auto now = ledcast::util::NowMs();
  queue.Enqueue(Task("later", now + 60000));
  queue.Enqueue(Task("now"));

  assert(queue.TryDequeue()->source_id == "now");
  assert(!queue.TryDequeue().has_value());
  assert(queue.Size() == 1);

  // Re-enqueueing keeps the earlier eligibility.
  queue.Enqueue(Task("later", now));
  assert(queue.TryDequeue()->source_id == "later");
}

void TestRemove() {
  JobQueue queue;
  queue.Enqueue(Task("a"));
  assert(queue.Remove("a"));
  assert(!queue.Remove("a"));
  assert(queue.Size() == 0);
}

void TestDequeueWakesOnEnqueueAndShutdown() {
  JobQueue queue;

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.Enqueue(Task("x"));
  });
  const auto task = queue.Dequeue();
  producer.join();
  assert(task && task->source_id == "x");

  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.Shutdown();
  });
  assert(!queue.Dequeue().has_value());
  stopper.join();
}

void TestDequeueWaitsForBackoff() {
  JobQueue   queue;
  const auto start = std::chrono::steady_clock::now();
  queue.Enqueue(Task("soon", ledcast::util::NowMs() + 100));

  const auto task = queue.Dequeue();
  assert(task && task->source_id == "soon");
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(90));
}

} // namespace

int main() {
  TestFifoAndDedupe();
  TestBackoffDefersTask();
  TestRemove();
  TestDequeueWakesOnEnqueueAndShutdown();
  TestDequeueWaitsForBackoff();

  std::cout << "ledcast_unit_job_queue: pass\n";
  return 0;
}
