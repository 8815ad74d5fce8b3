#pragma once

#include <string>

#include <flotilla/orchestrator/results.hpp>
#include <flotilla/state/orchestration_state.hpp>

namespace flot::tasks {
class TaskStore;
}
namespace flot::worktree {
class WorktreeStore;
}
namespace flot::agents {
class AgentRunner;
}

namespace flot::orchestrator {
/** @brief Result of one reconciliation pass: the next state and what moved.
 */
struct ReconcilePass {
  state::OrchestrationState next;
  PollResult result;
  bool changed() const {
    return !result.newlyCompleted.empty() || !result.newlyFailed.empty();
  }
};

/** @brief Classifies spawned workers from durable signals only.
 *
 * Signals are task status, worktree ownership and liveness as reported by
 * the runner. The first matching rule wins:
 *  1. missing or malformed session id: failed
 *  2. task closed: completed
 *  3. worker alive: still running
 *  4. task open: failed, exited before starting work
 *  5. task in progress, worktree released: failed
 *  6. task in progress, worktree still owned: failed, exited without
 *     completing
 */
class StatusReconciler {
  public:
  StatusReconciler(const tasks::TaskStore& tasks,
                   const worktree::WorktreeStore& worktrees,
                   agents::AgentRunner& runner);
  ~StatusReconciler();

  ReconcilePass reconcile(state::OrchestrationState current) const;

  private:
  enum class Outcome { Completed, Failed, Running };
  struct Classification {
    Outcome outcome = Outcome::Failed;
    std::string reason;
    state::CompletedAgent completed;
  };

  Classification classify(const state::SpawnedAgent& agent) const;

  const tasks::TaskStore& m_tasks;
  const worktree::WorktreeStore& m_worktrees;
  agents::AgentRunner& m_runner;
};
}
