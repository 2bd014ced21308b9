#include "asio_scheduler.hpp"

#include <boost/asio/post.hpp>

#include <exception>

#include "internal/observability/logging.hpp"

namespace household::runtime {

AsioScheduler::AsioScheduler(std::size_t threads) : thread_count_(threads == 0 ? 1 : threads) {
}

AsioScheduler::~AsioScheduler() {
  Stop();
}

void AsioScheduler::Start() {
  if (running_.exchange(true)) return;
  stopped_ = false;

  io_.restart();
  work_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] { io_.run(); });
  }
}

void AsioScheduler::Stop() {
  stopped_ = true;
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(timers_mutex_);
    for (auto& [id, timer] : timers_) {
      timer->cancel();
    }
    timers_.clear();
  }

  work_.reset();
  io_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) thread.join();
  }
  threads_.clear();
}

void AsioScheduler::RunTask(const Task& task) const {
  try {
    task();
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_ERROR("Scheduled task failed", {observability::StringField("error", e.what())});
  }
}

void AsioScheduler::Post(Task task) {
  if (stopped_) return;
  boost::asio::post(io_, [this, task = std::move(task)] { RunTask(task); });
}

Scheduler::TaskId AsioScheduler::ScheduleAfter(util::Millis delay, Task task) {
  if (stopped_) return kNoTask;

  auto   timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
  TaskId id    = kNoTask;
  {
    std::lock_guard lock(timers_mutex_);
    id = next_id_++;
    timers_.emplace(id, timer);
  }

  timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
    {
      std::lock_guard lock(timers_mutex_);
      auto            it = timers_.find(id);
      if (it == timers_.end()) return;
      timers_.erase(it);
    }
    if (ec) return;
    RunTask(task);
  });
  return id;
}

bool AsioScheduler::Cancel(TaskId id) {
  std::lock_guard lock(timers_mutex_);
  auto            it = timers_.find(id);
  if (it == timers_.end()) return false;
  it->second->cancel();
  timers_.erase(it);
  return true;
}

util::TimePoint AsioScheduler::Now() const {
  return util::Clock::now();
}

} // namespace household::runtime
