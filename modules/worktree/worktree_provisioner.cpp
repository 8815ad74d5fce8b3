#include <algorithm>

#include <boost/filesystem/path.hpp>

#include <flotilla/common/log.h>
#include <flotilla/tasks/task.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/git_ops.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>
#include <flotilla/worktree/worktree_store.hpp>

#include "workspace_init.hpp"

namespace flot::worktree {
WorktreeProvisioner::WorktreeProvisioner(WorktreeStore& store,
                                         GitOps& git,
                                         ProvisionerConfig config)
  : m_store(store)
  , m_git(git)
  , m_config(std::move(config)) {}
WorktreeProvisioner::~WorktreeProvisioner() {}

std::string
WorktreeProvisioner::BranchName(const std::string& taskId) {
  return "task/" + taskId;
}

std::string
WorktreeProvisioner::worktreePath(const std::string& branchName) const {
  std::string dir = branchName;
  std::replace(dir.begin(), dir.end(), '/', '-');
  return (boost::filesystem::path(m_config.worktreeRoot) / m_config.project /
          dir)
    .string();
}

ProvisionResult
WorktreeProvisioner::provision(const tasks::Task& task) {
  std::lock_guard lock(m_mutex);
  ProvisionResult result;

  if(auto existing = m_store.getByTask(task.id)) {
    if(existing->owned()) {
      result.reason = "Already has active worktree: " + existing->id;
      return result;
    }
    // Active without owner: provisioned for a spawn that has not claimed it
    // yet, possibly from another session.
    if(existing->status == WorktreeStatus::Active) {
      result.reason =
        "Worktree " + existing->id + " is reserved for a spawn in progress";
      return result;
    }
    if(existing->status == WorktreeStatus::Released) {
      flot_log(FLOT_WORKTREE,
               FLOT_DEBUG,
               "Reusing released worktree {} at {} for task {}",
               existing->id,
               existing->path,
               task.id);
      // Flipping to active under the mutex reserves it for this caller.
      flot_status s =
        m_store.updateStatus(existing->id, WorktreeStatus::Active);
      if(s != FLOT_OK) {
        result.reason = "Failed to reactivate worktree " + existing->id +
                        ": " + flot_status_to_str(s);
        return result;
      }
      existing->status = WorktreeStatus::Active;
      result.success = true;
      result.reused = true;
      result.worktree = std::move(existing);
      return result;
    }
  }

  const std::string branch = BranchName(task.id);
  if(auto byBranch = m_store.getByBranch(m_config.project, branch)) {
    if(byBranch->owned()) {
      result.reason = "Branch " + branch + " has active agent";
      return result;
    }
  }

  Worktree wt;
  wt.project = m_config.project;
  wt.branchName = branch;
  wt.path = worktreePath(branch);
  wt.baseBranch = m_config.baseBranch;
  wt.taskId = task.id;
  wt.status = WorktreeStatus::Active;

  auto gitResult = m_git.createWorktree(wt.path, branch, wt.baseBranch, true);
  if(!gitResult.success) {
    flot_log(FLOT_WORKTREE,
             FLOT_LOCALWARNING,
             "Could not create worktree for task {}: {}",
             task.id,
             gitResult.message);
    const std::string prefix = "Failed to create worktree";
    result.reason = gitResult.message.compare(0, prefix.size(), prefix) == 0
                      ? gitResult.message
                      : prefix + ": " + gitResult.message;
    return result;
  }

  auto created = m_store.create(wt);
  if(!created) {
    rollback(wt, true);
    result.reason = "Failed to store worktree record for " + wt.path;
    return result;
  }

  std::string error;
  flot_status s = InitializeWorkspace(
    *created, m_git.repoPath(), m_config.projectConfigDir, m_config.project,
    error);
  if(s != FLOT_OK) {
    flot_log(FLOT_WORKTREE,
             FLOT_LOCALWARNING,
             "Initialization of worktree {} failed, rolling back: {}",
             created->path,
             error);
    rollback(*created, true);
    result.reason = "Failed to initialize worktree: " + error;
    return result;
  }

  flot_log(FLOT_WORKTREE,
           FLOT_INFO,
           "Provisioned worktree {} at {} (branch {}) for task {}",
           created->id,
           created->path,
           branch,
           task.id);

  result.success = true;
  result.worktree = std::move(created);
  return result;
}

void
WorktreeProvisioner::rollback(const Worktree& worktree, bool gitCreated) {
  if(gitCreated) {
    auto r = m_git.deleteWorktree(worktree.path, true);
    if(!r.success) {
      flot_log(FLOT_WORKTREE,
               FLOT_LOCALERROR,
               "Rollback could not delete worktree {}: {}",
               worktree.path,
               r.message);
    }
    r = m_git.deleteBranch(worktree.branchName);
    if(!r.success) {
      flot_log(FLOT_WORKTREE,
               FLOT_LOCALERROR,
               "Rollback could not delete branch {}: {}",
               worktree.branchName,
               r.message);
    }
  }
  if(!worktree.id.empty()) {
    flot_status s = m_store.remove(worktree.id);
    if(s != FLOT_OK && s != FLOT_NOT_FOUND) {
      flot_log(FLOT_WORKTREE,
               FLOT_LOCALERROR,
               "Rollback could not remove worktree record {}: {}",
               worktree.id,
               flot_status_to_str(s));
    }
  }
}

flot_status
WorktreeProvisioner::claim(const std::string& worktreeId,
                           const std::string& sessionId) {
  flot_status s = m_store.claim(worktreeId, sessionId);
  if(s == FLOT_OK) {
    flot_log(FLOT_WORKTREE,
             FLOT_DEBUG,
             "Worktree {} claimed by session {}",
             worktreeId,
             sessionId);
  }
  return s;
}

flot_status
WorktreeProvisioner::release(const std::string& worktreeId) {
  flot_status s = m_store.release(worktreeId);
  if(s == FLOT_OK) {
    flot_log(FLOT_WORKTREE, FLOT_DEBUG, "Worktree {} released", worktreeId);
  }
  return s;
}

flot_status
WorktreeProvisioner::destroy(const std::string& worktreeId,
                             bool force,
                             bool deleteBranch) {
  auto wt = m_store.get(worktreeId);
  if(!wt) {
    flot_log(FLOT_WORKTREE,
             FLOT_DEBUG,
             "Worktree {} already gone, nothing to destroy",
             worktreeId);
    return FLOT_OK;
  }

  auto r = m_git.deleteWorktree(wt->path, force);
  if(!r.success) {
    flot_log(FLOT_WORKTREE,
             FLOT_LOCALERROR,
             "Could not delete worktree {} at {}: {}",
             worktreeId,
             wt->path,
             r.message);
    return FLOT_GIT_ERROR;
  }

  // The files are gone, so the record goes too, whatever happens to the
  // branch.
  flot_status s = m_store.remove(worktreeId);
  if(s != FLOT_OK && s != FLOT_NOT_FOUND)
    return s;

  if(deleteBranch && !wt->branchName.empty()) {
    r = m_git.deleteBranch(wt->branchName);
    if(!r.success) {
      flot_log(FLOT_WORKTREE,
               FLOT_LOCALERROR,
               "Removed worktree {} but could not delete branch {}: {}",
               worktreeId,
               wt->branchName,
               r.message);
      return FLOT_GIT_ERROR;
    }
  }

  flot_log(FLOT_WORKTREE,
           FLOT_INFO,
           "Destroyed worktree {} at {}{}",
           worktreeId,
           wt->path,
           deleteBranch ? " including branch " + wt->branchName : "");
  return FLOT_OK;
}

StaleCleanupResult
WorktreeProvisioner::cleanupStale(std::chrono::hours olderThan, bool dryRun) {
  std::lock_guard lock(m_mutex);
  StaleCleanupResult result;
  result.dryRun = dryRun;

  auto cutoff = boost::posix_time::microsec_clock::universal_time() -
                boost::posix_time::hours(olderThan.count());

  auto olderThanCutoff = [&cutoff](const Worktree& w) {
    auto t = util::ParseIso(w.updatedAt);
    return t && *t < cutoff;
  };

  for(auto& wt : m_store.list(m_config.project)) {
    if(!olderThanCutoff(wt))
      continue;

    if((wt.status == WorktreeStatus::Active && !wt.owned()) ||
       wt.status == WorktreeStatus::Released) {
      if(!dryRun) {
        flot_status s = m_store.updateStatus(wt.id, WorktreeStatus::Stale);
        if(s != FLOT_OK) {
          result.failed.emplace_back(wt.id, flot_status_to_str(s));
          continue;
        }
      }
      wt.status = WorktreeStatus::Stale;
    }

    if(wt.status != WorktreeStatus::Stale &&
       wt.status != WorktreeStatus::Abandoned)
      continue;

    result.candidates.push_back(wt);
    if(dryRun)
      continue;

    flot_status s = destroy(wt.id, true, true);
    if(s == FLOT_OK) {
      result.cleaned.push_back(wt.id);
    } else {
      result.failed.emplace_back(wt.id, flot_status_to_str(s));
    }
  }

  flot_log(FLOT_WORKTREE,
           FLOT_INFO,
           "Stale cleanup: {} candidates, {} cleaned, {} failed{}",
           result.candidates.size(),
           result.cleaned.size(),
           result.failed.size(),
           dryRun ? " (dry run)" : "");
  return result;
}
}
