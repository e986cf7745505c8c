#include "internal/uniq/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/uniq/progress_channel.hpp"
#include "internal/uniq/task_queue.hpp"

namespace {

void TestTasksRunAndDeliverResults() {
  mc3d::uniq::WorkerPool pool(4);
  assert(pool.Size() == 4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 64; ++i) {
    futures.push_back(pool.Submit([i] { return i * i; }));
  }

  for (int i = 0; i < 64; ++i) {
    assert(futures[static_cast<size_t>(i)].get() == i * i);
  }
}

void TestExceptionsTravelThroughTheFuture() {
  mc3d::uniq::WorkerPool pool(2);

  auto failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  auto healthy = pool.Submit([] { return 7; });

  bool threw = false;
  try {
    (void)failing.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(healthy.get() == 7);
}

void TestStopFinishesQueuedTasks() {
  std::atomic<int> done{0};
  {
    mc3d::uniq::WorkerPool pool(1);
    for (int i = 0; i < 10; ++i) {
      (void)pool.Submit([&done] {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++done;
      });
    }
    pool.Stop();
    pool.Stop();
  }
  assert(done.load() == 10);
}

void TestZeroWorkersIsRejected() {
  bool threw = false;
  try {
    mc3d::uniq::WorkerPool pool(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestQueueRejectsAfterShutdown() {
  mc3d::uniq::TaskQueue queue;
  queue.Enqueue([] {});
  queue.Shutdown();

  // queued work is still handed out, then the queue reports exhaustion
  assert(queue.Dequeue().has_value());
  assert(!queue.Dequeue().has_value());

  bool threw = false;
  try {
    queue.Enqueue([] {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestProgressChannelDrainsInOrder() {
  mc3d::uniq::ProgressChannel channel(4);
  assert(channel.Capacity() == 4);

  assert(channel.Send("FeO"));
  assert(channel.Send("NaCl|225"));

  auto drained = channel.Drain();
  assert(drained.size() == 2);
  assert(drained[0] == "FeO");
  assert(drained[1] == "NaCl|225");
  assert(channel.Drain().empty());
}

void TestFullChannelBlocksUntilDrained() {
  mc3d::uniq::ProgressChannel channel(1);
  assert(channel.Send("first"));

  std::atomic<bool> sent{false};
  std::thread       sender([&] {
    channel.Send("second");
    sent = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!sent.load());

  auto drained = channel.Drain();
  assert(drained.size() == 1);
  sender.join();
  assert(sent.load());
  assert(channel.Drain().size() == 1);
}

void TestCloseReleasesBlockedSenders() {
  mc3d::uniq::ProgressChannel channel(1);
  assert(channel.Send("first"));

  std::atomic<bool> result{true};
  std::thread       sender([&] { result = channel.Send("second"); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  sender.join();

  assert(!result.load());
  assert(!channel.Send("third"));
}

} // namespace

int main() {
  TestTasksRunAndDeliverResults();
  TestExceptionsTravelThroughTheFuture();
  TestStopFinishesQueuedTasks();
  TestZeroWorkersIsRejected();
  TestQueueRejectsAfterShutdown();
  TestProgressChannelDrainsInOrder();
  TestFullChannelBlocksUntilDrained();
  TestCloseReleasesBlockedSenders();

  std::cout << "mc3d_unit_worker_pool: pass\n";
  return 0;
}
