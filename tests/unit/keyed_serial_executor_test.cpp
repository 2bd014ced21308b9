#include "internal/runtime/keyed_serial_executor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/runtime/asio_scheduler.hpp"
#include "tests/support/manual_scheduler.hpp"

namespace {

using household::runtime::AsioScheduler;
using household::runtime::KeyedSerialExecutor;
using household::test_support::ManualScheduler;

void TestOrderPerKey() {
  auto                scheduler = std::make_shared<ManualScheduler>();
  KeyedSerialExecutor lanes(scheduler);

  std::vector<std::string> ran;
  lanes.Submit("a", [&] { ran.push_back("a1"); });
  lanes.Submit("a", [&] { ran.push_back("a2"); });
  lanes.Submit("b", [&] { ran.push_back("b1"); });
  lanes.Submit("a", [&] { ran.push_back("a3"); });

  // One drain task per key, not per item.
  assert(scheduler->PendingPosts() == 2);

  scheduler->RunPending();
  assert(ran.size() == 4);

  std::vector<std::string> a;
  for (const auto& item : ran) {
    if (item.front() == 'a') a.push_back(item);
  }
  assert((a == std::vector<std::string>{"a1", "a2", "a3"}));
  // Interleaved: a long lane does not hold b back until it drains.
  assert(ran[1] == "b1");
}

void TestThrowingTaskDoesNotStallLane() {
  auto                scheduler = std::make_shared<ManualScheduler>();
  KeyedSerialExecutor lanes(scheduler);

  int after = 0;
  lanes.Submit("a", [] { throw std::runtime_error("boom"); });
  lanes.Submit("a", [&] { ++after; });
  scheduler->RunPending();
  assert(after == 1);

  // The lane restarts on the next submit.
  lanes.Submit("a", [&] { ++after; });
  scheduler->RunPending();
  assert(after == 2);
}

void TestDiscardDropsQueuedTasks() {
  auto                scheduler = std::make_shared<ManualScheduler>();
  KeyedSerialExecutor lanes(scheduler);

  int ran = 0;
  lanes.Submit("a", [&] { ++ran; });
  lanes.Submit("a", [&] { ++ran; });
  lanes.Discard("a");
  scheduler->RunPending();
  assert(ran == 0);

  // The emptied lane still accepts work.
  lanes.Submit("a", [&] { ++ran; });
  scheduler->RunPending();
  assert(ran == 1);

  lanes.Discard("missing");
}

void TestNoConcurrencyWithinKeyOnThreadPool() {
  auto scheduler = std::make_shared<AsioScheduler>(4);
  scheduler->Start();

  constexpr int kTasks = 200;

  std::map<std::string, int> running;
  std::map<std::string, int> last;
  std::mutex                 mutex;
  std::atomic<int>           done{0};
  std::atomic<bool>          overlap{false};
  std::atomic<bool>          reordered{false};

  {
    KeyedSerialExecutor lanes(scheduler);
    for (int i = 0; i < kTasks; ++i) {
      const std::string key = "device-" + std::to_string(i % 3);
      lanes.Submit(key, [&, key, i] {
        {
          std::lock_guard lock(mutex);
          if (++running[key] > 1) overlap = true;
          auto it = last.find(key);
          if (it != last.end() && it->second > i) reordered = true;
          last[key] = i;
        }
        std::this_thread::yield();
        {
          std::lock_guard lock(mutex);
          --running[key];
        }
        ++done;
      });
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (done < kTasks && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    scheduler->Stop();
  }

  assert(done == kTasks);
  assert(!overlap);
  assert(!reordered);
}

} // namespace

int main() {
  TestOrderPerKey();
  TestThrowingTaskDoesNotStallLane();
  TestDiscardDropsQueuedTasks();
  TestNoConcurrencyWithinKeyOnThreadPool();

  std::cout << "household_unit_keyed_serial_executor: pass\n";
  return 0;
}
