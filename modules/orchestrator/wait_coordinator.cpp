#include <algorithm>
#include <thread>

#include <flotilla/common/log.h>
#include <flotilla/orchestrator/cancellation.hpp>
#include <flotilla/tasks/task_store.hpp>

#include "wait_coordinator.hpp"

namespace flot::orchestrator {
namespace {
using Clock = std::chrono::steady_clock;

/** @brief Sleeps until the next poll or the deadline, whatever comes first.
 * Returns true if the wait was cancelled. */
bool
SleepUntilNextPoll(Clock::time_point deadline,
                   std::chrono::milliseconds pollInterval,
                   Cancellation* cancellation) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - Clock::now());
  auto sleep = std::max(std::chrono::milliseconds(1),
                        std::min(pollInterval, left));
  if(cancellation)
    return cancellation->sleepFor(sleep);
  std::this_thread::sleep_for(sleep);
  return false;
}

std::chrono::milliseconds
Since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}
}

WaitCoordinator::WaitCoordinator(const tasks::TaskStore& tasks)
  : m_tasks(tasks) {}
WaitCoordinator::~WaitCoordinator() {}

WaitResult
WaitCoordinator::wait(const std::string& taskId,
                      std::chrono::milliseconds timeout,
                      std::chrono::milliseconds pollInterval,
                      Cancellation* cancellation) const {
  WaitResult result;
  result.taskId = taskId;

  if(pollInterval.count() <= 0) {
    result.status = FLOT_INVALID_ARGUMENT;
    result.error = "poll_interval must be positive";
    return result;
  }

  const auto start = Clock::now();
  const auto deadline = start + timeout;

  flot_log(FLOT_WAIT,
           FLOT_DEBUG,
           "Waiting up to {}ms for task {}",
           timeout.count(),
           taskId);

  while(true) {
    auto task = m_tasks.get(taskId);
    if(!task) {
      result.status = FLOT_NOT_FOUND;
      result.error = "Task " + taskId + " not found";
      result.waitTime = Since(start);
      return result;
    }
    if(tasks::IsTerminal(task->status)) {
      result.completed = true;
      result.finalStatus = task->status;
      result.waitTime = Since(start);
      flot_log(FLOT_WAIT,
               FLOT_DEBUG,
               "Task {} reached {} after {}ms",
               taskId,
               tasks::TaskStatusToStr(task->status),
               result.waitTime.count());
      return result;
    }
    if(Clock::now() >= deadline) {
      result.timedOut = true;
      result.finalStatus = task->status;
      result.waitTime = Since(start);
      flot_log(FLOT_WAIT,
               FLOT_DEBUG,
               "Timed out waiting for task {}, still {}",
               taskId,
               tasks::TaskStatusToStr(task->status));
      return result;
    }
    if(SleepUntilNextPoll(deadline, pollInterval, cancellation)) {
      result.cancelled = true;
      result.finalStatus = task->status;
      result.waitTime = Since(start);
      return result;
    }
  }
}

WaitAnyResult
WaitCoordinator::waitAny(const std::vector<std::string>& taskIds,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds pollInterval,
                         Cancellation* cancellation) const {
  WaitAnyResult result;
  if(taskIds.empty() || pollInterval.count() <= 0) {
    result.status = FLOT_INVALID_ARGUMENT;
    result.error = taskIds.empty() ? "No task ids given"
                                   : "poll_interval must be positive";
    return result;
  }

  const auto start = Clock::now();
  const auto deadline = start + timeout;

  while(true) {
    for(const auto& id : taskIds) {
      auto task = m_tasks.get(id);
      if(!task) {
        result.status = FLOT_NOT_FOUND;
        result.error = "Task " + id + " not found";
        result.waitTime = Since(start);
        return result;
      }
      if(tasks::IsTerminal(task->status)) {
        result.completedTaskId = id;
        result.waitTime = Since(start);
        return result;
      }
    }
    if(Clock::now() >= deadline) {
      result.timedOut = true;
      result.waitTime = Since(start);
      return result;
    }
    if(SleepUntilNextPoll(deadline, pollInterval, cancellation)) {
      result.cancelled = true;
      result.waitTime = Since(start);
      return result;
    }
  }
}

WaitAllResult
WaitCoordinator::waitAll(const std::vector<std::string>& taskIds,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds pollInterval,
                         Cancellation* cancellation) const {
  WaitAllResult result;
  if(pollInterval.count() <= 0) {
    result.status = FLOT_INVALID_ARGUMENT;
    result.error = "poll_interval must be positive";
    return result;
  }

  const auto start = Clock::now();
  const auto deadline = start + timeout;

  while(true) {
    result.completed.clear();
    result.pending.clear();
    for(const auto& id : taskIds) {
      auto task = m_tasks.get(id);
      if(!task) {
        result.status = FLOT_NOT_FOUND;
        result.error = "Task " + id + " not found";
        result.waitTime = Since(start);
        return result;
      }
      (tasks::IsTerminal(task->status) ? result.completed : result.pending)
        .push_back(id);
    }
    if(result.pending.empty()) {
      result.allCompleted = true;
      result.waitTime = Since(start);
      return result;
    }
    if(Clock::now() >= deadline) {
      result.timedOut = true;
      result.waitTime = Since(start);
      return result;
    }
    if(SleepUntilNextPoll(deadline, pollInterval, cancellation)) {
      result.cancelled = true;
      result.waitTime = Since(start);
      return result;
    }
  }
}
}
