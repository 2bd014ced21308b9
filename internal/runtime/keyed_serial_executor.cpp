#include "keyed_serial_executor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace household::runtime {

KeyedSerialExecutor::KeyedSerialExecutor(std::shared_ptr<Scheduler> scheduler) : scheduler_(std::move(scheduler)) {
}

void KeyedSerialExecutor::Submit(const std::string& key, Scheduler::Task task) {
  bool start = false;
  {
    std::lock_guard lock(mutex_);
    auto&           lane = lanes_[key];
    lane.tasks.push_back(std::move(task));
    if (!lane.draining) {
      lane.draining = true;
      start         = true;
    }
  }

  if (start) {
    scheduler_->Post([this, key] { DrainOne(key); });
  }
}

void KeyedSerialExecutor::Discard(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = lanes_.find(key);
  if (it == lanes_.end()) return;
  it->second.tasks.clear();
}

void KeyedSerialExecutor::DrainOne(const std::string& key) {
  Scheduler::Task task;
  {
    std::lock_guard lock(mutex_);
    auto            it = lanes_.find(key);
    if (it == lanes_.end()) return;
    if (it->second.tasks.empty()) {
      lanes_.erase(it);
      return;
    }
    task = std::move(it->second.tasks.front());
    it->second.tasks.pop_front();
  }

  try {
    task();
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_ERROR("Serial task failed", {observability::StringField("key", key), observability::StringField("error", e.what())});
  }

  bool more = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = lanes_.find(key);
    if (it != lanes_.end()) {
      if (it->second.tasks.empty()) {
        lanes_.erase(it);
      } else {
        more = true;
      }
    }
  }

  if (more) {
    scheduler_->Post([this, key] { DrainOne(key); });
  }
}

} // namespace household::runtime
