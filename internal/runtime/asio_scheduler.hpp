#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "scheduler.hpp"

namespace household::runtime {

/*
  Scheduler backed by an io_context and a fixed pool of threads.

  Work posted or scheduled before Start() is queued and runs once the pool
  starts. After Stop() new work is dropped: Post does nothing and
  ScheduleAfter returns kNoTask.
*/
class AsioScheduler final : public Scheduler {
 public:
  explicit AsioScheduler(std::size_t threads);
  ~AsioScheduler() override;

  AsioScheduler(const AsioScheduler&)            = delete;
  AsioScheduler& operator=(const AsioScheduler&) = delete;

  void Start();
  // Cancels pending timers, drains nothing further, joins the pool.
  void Stop();

  void   Post(Task task) override;
  TaskId ScheduleAfter(util::Millis delay, Task task) override;
  bool   Cancel(TaskId id) override;

  util::TimePoint Now() const override;

 private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  void RunTask(const Task& task) const;

  std::size_t                thread_count_;
  boost::asio::io_context    io_;
  std::unique_ptr<WorkGuard> work_;
  std::vector<std::thread>   threads_;
  std::atomic<bool>          running_{false};
  std::atomic<bool>          stopped_{false};

  std::mutex                                                             timers_mutex_;
  TaskId                                                                 next_id_{1};
  std::unordered_map<TaskId, std::shared_ptr<boost::asio::steady_timer>> timers_;
};

} // namespace household::runtime
