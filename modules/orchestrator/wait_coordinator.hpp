#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <flotilla/orchestrator/results.hpp>

namespace flot::tasks {
class TaskStore;
}

namespace flot::orchestrator {
class Cancellation;

/** @brief Blocking polls for tasks to reach closed or failed.
 *
 * The only place in the orchestrator that sleeps. Sleeping happens on the
 * given Cancellation, so another thread can end a wait early.
 */
class WaitCoordinator {
  public:
  explicit WaitCoordinator(const tasks::TaskStore& tasks);
  ~WaitCoordinator();

  WaitResult wait(const std::string& taskId,
                  std::chrono::milliseconds timeout,
                  std::chrono::milliseconds pollInterval,
                  Cancellation* cancellation = nullptr) const;

  WaitAnyResult waitAny(const std::vector<std::string>& taskIds,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds pollInterval,
                        Cancellation* cancellation = nullptr) const;

  WaitAllResult waitAll(const std::vector<std::string>& taskIds,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds pollInterval,
                        Cancellation* cancellation = nullptr) const;

  private:
  const tasks::TaskStore& m_tasks;
};
}
