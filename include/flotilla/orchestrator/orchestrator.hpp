#ifndef FLOTILLA_ORCHESTRATOR_ORCHESTRATOR_HPP
#define FLOTILLA_ORCHESTRATOR_ORCHESTRATOR_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flotilla/orchestrator/config.hpp"
#include "flotilla/orchestrator/options.hpp"
#include "flotilla/orchestrator/results.hpp"
#include "flotilla/worktree/worktree_provisioner.hpp"

namespace flot::tasks {
class TaskStore;
}
namespace flot::worktree {
class WorktreeStore;
class GitOps;
}
namespace flot::agents {
class AgentRunner;
}
namespace flot::state {
class StateDocumentStore;
}

namespace flot::orchestrator {
class Cancellation;

/** @brief Entry point of the hosting layer.
 *
 * Each operation is one synchronous pass. Passes for the same session are
 * serialized, the session document is read at the start of a pass and
 * written back before it returns.
 *
 * All collaborators must outlive the orchestrator. Without an agent runner
 * only the operations that never need to spawn or observe workers work.
 */
class Orchestrator {
  public:
  Orchestrator(tasks::TaskStore& tasks,
               worktree::WorktreeStore& worktrees,
               worktree::GitOps& git,
               agents::AgentRunner* runner,
               state::StateDocumentStore& states,
               OrchestratorConfig config);
  ~Orchestrator();

  /** @brief Provisions worktrees and spawns workers for the ready subtasks
   * of the parent, up to the free concurrency slots.
   *
   * An empty mode uses the configured default, no maxConcurrent the
   * configured maximum.
   */
  OrchestrateResult orchestrateReadyTasks(
    const std::string& parentTaskId,
    const std::string& parentSessionId,
    std::optional<uint32_t> maxConcurrent = std::nullopt,
    const std::string& mode = "");

  /** @brief Classifies all spawned workers of the session. */
  PollResult pollAgentStatus(const std::string& parentSessionId);

  ReviewResult processCompletedAgents(const std::string& parentSessionId,
                                      const ReviewOptions& options);

  CleanupResult cleanupReviewedWorktrees(const std::string& parentSessionId,
                                         const MergeOptions& options);

  worktree::StaleCleanupResult cleanupStaleWorktrees(
    std::chrono::hours olderThan,
    bool dryRun = false);

  OrchestrationStatus getOrchestrationStatus(
    const std::string& parentTaskId,
    const std::string& parentSessionId);

  WaitResult waitForTask(const std::string& taskId,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds pollInterval,
                         Cancellation* cancellation = nullptr);
  WaitAnyResult waitForAnyTask(const std::vector<std::string>& taskIds,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds pollInterval,
                               Cancellation* cancellation = nullptr);
  WaitAllResult waitForAllTasks(const std::vector<std::string>& taskIds,
                                std::chrono::milliseconds timeout,
                                std::chrono::milliseconds pollInterval,
                                Cancellation* cancellation = nullptr);

  /** @brief Merge options derived from the configuration. */
  MergeOptions defaultMergeOptions() const;
  ReviewOptions defaultReviewOptions() const;

  const OrchestratorConfig& config() const;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;
};
}

#endif
