#pragma once

#include <string>

#include <flotilla/orchestrator/options.hpp>
#include <flotilla/orchestrator/results.hpp>
#include <flotilla/state/orchestration_state.hpp>

namespace flot::tasks {
class TaskStore;
}
namespace flot::worktree {
class WorktreeProvisioner;
}

namespace flot::orchestrator {
/** @brief Routes completed and failed records of one session.
 *
 * Completed work goes to reviewed, back to open for a retry, or to the
 * escalated list. Failed records of workers that merely went away are
 * retried, everything else is escalated.
 */
class ReviewRouter {
  public:
  ReviewRouter(tasks::TaskStore& tasks,
               worktree::WorktreeProvisioner& provisioner);
  ~ReviewRouter();

  ReviewResult route(state::OrchestrationState& state,
                     const ReviewOptions& options);

  private:
  /** @brief Reopens the task and releases its worktree so the next
   * orchestration pass picks it up again. */
  bool retry(const state::SpawnedAgent& agent, std::string& error);

  tasks::TaskStore& m_tasks;
  worktree::WorktreeProvisioner& m_provisioner;
};
}
