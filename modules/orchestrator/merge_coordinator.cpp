#include <algorithm>

#include <flotilla/common/log.h>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/git_ops.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>
#include <flotilla/worktree/worktree_store.hpp>

#include "merge_coordinator.hpp"

namespace flot::orchestrator {
namespace {
bool
IsConflict(const worktree::GitResult& r) {
  return r.output.find("CONFLICT") != std::string::npos ||
         r.error.find("CONFLICT") != std::string::npos ||
         r.message.find("CONFLICT") != std::string::npos;
}
}

MergeCoordinator::MergeCoordinator(worktree::GitOps& git,
                                   worktree::WorktreeStore& worktrees,
                                   worktree::WorktreeProvisioner& provisioner)
  : m_git(git)
  , m_worktrees(worktrees)
  , m_provisioner(provisioner) {}
MergeCoordinator::~MergeCoordinator() {}

bool
MergeCoordinator::mergeBranch(const std::string& branch,
                              const std::string& baseBranch,
                              const MergeOptions& options,
                              std::string& commitOrReason) {
  const bool remote = m_git.hasRemote(options.remote);

  if(remote) {
    auto fetch = m_git.fetch(options.remote, baseBranch);
    if(!fetch.success) {
      commitOrReason = "Failed to fetch: " + fetch.message;
      return false;
    }
  }

  auto checkout = m_git.checkout(baseBranch);
  if(!checkout.success) {
    commitOrReason = "Failed to checkout " + baseBranch + ": " +
                     checkout.message;
    return false;
  }

  if(remote) {
    auto pull = m_git.pull(options.remote, baseBranch);
    if(!pull.success) {
      commitOrReason = "Failed to pull: " + pull.message;
      return false;
    }
  }

  auto merge = m_git.merge(branch, "Merge branch '" + branch + "'");
  if(!merge.success) {
    if(IsConflict(merge)) {
      auto abort = m_git.mergeAbort();
      if(!abort.success) {
        flot_log(FLOT_MERGE,
                 FLOT_GLOBALERROR,
                 "Could not abort conflicting merge of {}: {}. Repository "
                 "needs manual cleanup!",
                 branch,
                 abort.message);
      }
      commitOrReason = "Merge conflict merging " + branch + " into " +
                       baseBranch +
                       ". Resolve manually and run cleanup again.";
    } else {
      commitOrReason = "Merge failed: " + merge.message;
    }
    return false;
  }

  auto head = m_git.revParse("HEAD");
  if(!head.success) {
    commitOrReason = "Merged, but could not resolve HEAD: " + head.message;
    return false;
  }
  commitOrReason = head.output;

  if(remote && options.push) {
    auto push = m_git.push(options.remote, baseBranch);
    if(!push.success) {
      // The merge is done locally, a failed push is retried by the next
      // push to the base branch.
      flot_log(FLOT_MERGE,
               FLOT_LOCALWARNING,
               "Merged {} but push to {}/{} failed: {}",
               branch,
               options.remote,
               baseBranch,
               push.message);
    }
  }
  return true;
}

MergeCoordinator::RecordOutcome
MergeCoordinator::cleanupOne(const state::ReviewedAgent& agent,
                             const MergeOptions& options) {
  RecordOutcome out;
  out.merged.agent = agent;

  if(agent.worktreeId.empty()) {
    out.reason = "Missing worktree_id in reviewed agent record";
    return out;
  }

  auto wt = m_worktrees.get(agent.worktreeId);
  if(!wt) {
    flot_log(FLOT_MERGE,
             FLOT_DEBUG,
             "Worktree {} of task {} already cleaned up",
             agent.worktreeId,
             agent.taskId);
    out.success = true;
    out.merged.alreadyCleaned = true;
    return out;
  }

  const std::string branch =
    agent.branchName.empty() ? wt->branchName : agent.branchName;

  state::CleanupHistoryEntry history;
  history.worktreeId = wt->id;
  history.branchName = branch;
  history.taskId = agent.taskId;

  // The worktree merges back into the branch it was created from.
  const std::string& baseBranch =
    wt->baseBranch.empty() ? options.baseBranch : wt->baseBranch;

  if(options.mergeToBase) {
    std::string commitOrReason;
    if(!mergeBranch(branch, baseBranch, options, commitOrReason)) {
      out.reason = commitOrReason;
      return out;
    }
    out.merged.mergeCommit = commitOrReason;
    history.merged = true;
    history.mergeCommit = commitOrReason;

    flot_status s =
      m_worktrees.updateStatus(wt->id, worktree::WorktreeStatus::Merged);
    if(s != FLOT_OK) {
      flot_log(FLOT_MERGE,
               FLOT_LOCALWARNING,
               "Could not mark worktree {} merged: {}",
               wt->id,
               flot_status_to_str(s));
    }
    flot_log(FLOT_MERGE,
             FLOT_INFO,
             "Merged {} into {} as {}",
             branch,
             baseBranch,
             commitOrReason);
  }

  if(options.deleteWorktrees) {
    flot_status s = m_provisioner.destroy(
      wt->id, options.force || options.mergeToBase, options.deleteBranches);
    if(s != FLOT_OK) {
      out.reason = "Failed to delete worktree " + wt->id + ": " +
                   flot_status_to_str(s);
      // If the files are still there the record stays for another deletion
      // attempt. Merging the branch again then is a no-op.
      if(history.merged) {
        history.cleanedAt = util::NowIso();
        out.history = history;
      }
      return out;
    }
    out.merged.worktreeDeleted = true;
  }

  history.cleanedAt = util::NowIso();
  out.history = history;
  out.success = true;
  return out;
}

CleanupResult
MergeCoordinator::cleanup(state::OrchestrationState& state,
                          const MergeOptions& options,
                          const Persist& persist) {
  CleanupResult result;

  // Records are removed from state while iterating.
  const auto reviewed = state.reviewed;

  for(const auto& agent : reviewed) {
    RecordOutcome out;
    try {
      out = cleanupOne(agent, options);
    } catch(const std::exception& e) {
      out.success = false;
      out.reason = std::string("Cleanup failed: ") + e.what();
    }

    if(out.history)
      state.cleanupHistory.push_back(*out.history);

    if(out.success) {
      auto it = std::find(state.reviewed.begin(), state.reviewed.end(), agent);
      if(it != state.reviewed.end())
        state.reviewed.erase(it);
      result.merged.push_back(out.merged);
    } else {
      flot_log(FLOT_MERGE,
               FLOT_LOCALWARNING,
               "Cleanup of task {} ({}) failed: {}",
               agent.taskId,
               agent.branchName,
               out.reason);
      result.failed.push_back(MergeFailure{ agent, out.reason });
    }

    if(out.success || out.history) {
      flot_status s = persist(state);
      if(s != FLOT_OK) {
        flot_log(FLOT_MERGE,
                 FLOT_GLOBALERROR,
                 "Could not persist state after cleaning up task {}: {}",
                 agent.taskId,
                 flot_status_to_str(s));
        result.status = s;
        result.error = std::string("Could not persist state: ") +
                       flot_status_to_str(s);
        break;
      }
    }
  }
  return result;
}
}
