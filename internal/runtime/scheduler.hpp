#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "internal/util/time.hpp"

namespace household::runtime {

/*
  Work and timer source shared by every component.

  Post() runs a task on a worker; ScheduleAfter() runs it once after a delay
  unless cancelled first. Tasks must not throw.
*/
class Scheduler {
 public:
  using Task   = std::function<void()>;
  using TaskId = std::uint64_t;

  static constexpr TaskId kNoTask = 0;

  virtual ~Scheduler() = default;

  virtual void Post(Task task) = 0;

  virtual TaskId ScheduleAfter(util::Millis delay, Task task) = 0;

  // Returns false when the task already ran or was never scheduled.
  virtual bool Cancel(TaskId id) = 0;

  virtual util::TimePoint Now() const = 0;
};

} // namespace household::runtime
