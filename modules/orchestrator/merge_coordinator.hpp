#pragma once

#include <functional>
#include <string>

#include <flotilla/orchestrator/options.hpp>
#include <flotilla/orchestrator/results.hpp>
#include <flotilla/state/orchestration_state.hpp>

namespace flot::worktree {
class GitOps;
class WorktreeStore;
class WorktreeProvisioner;
}

namespace flot::orchestrator {
/** @brief Integrates reviewed branches into the base branch.
 *
 * Records are handled one by one and the state is persisted after each of
 * them. A conflict aborts the merge of that record only, the record stays in
 * the reviewed list for a later attempt.
 */
class MergeCoordinator {
  public:
  using Persist = std::function<flot_status(state::OrchestrationState&)>;

  MergeCoordinator(worktree::GitOps& git,
                   worktree::WorktreeStore& worktrees,
                   worktree::WorktreeProvisioner& provisioner);
  ~MergeCoordinator();

  CleanupResult cleanup(state::OrchestrationState& state,
                        const MergeOptions& options,
                        const Persist& persist);

  private:
  struct RecordOutcome {
    bool success = false;
    std::string reason;
    MergedAgent merged;
    std::optional<state::CleanupHistoryEntry> history;
  };

  RecordOutcome cleanupOne(const state::ReviewedAgent& agent,
                           const MergeOptions& options);

  /** @brief Runs the merge sequence of branch into baseBranch. Returns the
   * merge commit on success, the failure reason otherwise. */
  bool mergeBranch(const std::string& branch,
                   const std::string& baseBranch,
                   const MergeOptions& options,
                   std::string& commitOrReason);

  worktree::GitOps& m_git;
  worktree::WorktreeStore& m_worktrees;
  worktree::WorktreeProvisioner& m_provisioner;
};
}
