#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "scheduler.hpp"

namespace household::runtime {

/*
  Runs tasks FIFO per key on a shared Scheduler.

  Tasks for one key never run concurrently and keep submission order; tasks
  for different keys run in parallel. A key's queue is drained by a single
  posted task that reposts itself after each item so one busy key cannot
  starve the pool.
*/
class KeyedSerialExecutor {
 public:
  explicit KeyedSerialExecutor(std::shared_ptr<Scheduler> scheduler);

  void Submit(const std::string& key, Scheduler::Task task);

  // Queued tasks for key are discarded; one already running completes.
  void Discard(const std::string& key);

 private:
  struct Lane {
    std::deque<Scheduler::Task> tasks;
    bool                        draining{false};
  };

  void DrainOne(const std::string& key);

  std::shared_ptr<Scheduler> scheduler_;

  std::mutex                            mutex_;
  std::unordered_map<std::string, Lane> lanes_;
};

} // namespace household::runtime
