#include <algorithm>
#include <tuple>

#include <flotilla/agents/agent_runner.hpp>
#include <flotilla/agents/agent_spawner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/orchestrator/orchestrator.hpp>
#include <flotilla/state/state_document_store.hpp>
#include <flotilla/tasks/task_graph_resolver.hpp>
#include <flotilla/tasks/task_store.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/git_ops.hpp>
#include <flotilla/worktree/worktree_store.hpp>

#include "merge_coordinator.hpp"
#include "review_router.hpp"
#include "session_locks.hpp"
#include "status_reconciler.hpp"
#include "wait_coordinator.hpp"

namespace flot::orchestrator {
namespace {
worktree::ProvisionerConfig
MakeProvisionerConfig(const OrchestratorConfig& config) {
  worktree::ProvisionerConfig c;
  c.project = config.project;
  c.worktreeRoot = config.worktreeRoot;
  c.baseBranch = config.baseBranch;
  c.projectConfigDir = config.projectConfigDir;
  return c;
}

state::SpawnedAgent
MakeSpawnedAgent(const tasks::Task& task,
                 const worktree::Worktree& wt,
                 const agents::AgentHandle& handle) {
  state::SpawnedAgent a;
  a.sessionId = handle.sessionId;
  a.runId = handle.runId;
  a.taskId = task.id;
  a.worktreeId = wt.id;
  a.title = task.title;
  a.branchName = wt.branchName;
  a.worktreePath = wt.path;
  a.pid = handle.pid;
  a.spawnedAt = util::NowIso();
  return a;
}

SubtaskStatus
MakeSubtaskStatus(const tasks::Task& task,
                  const worktree::WorktreeStore& worktrees,
                  const state::OrchestrationState& state) {
  SubtaskStatus s;
  s.task = task;
  s.worktree = worktrees.getByTask(task.id);
  s.hasActiveAgent = state.tracksSpawnedTask(task.id) ||
                     (s.worktree && s.worktree->owned());
  return s;
}
}

struct Orchestrator::Internal {
  Internal(tasks::TaskStore& tasks,
           worktree::WorktreeStore& worktrees,
           worktree::GitOps& git,
           agents::AgentRunner* runner,
           state::StateDocumentStore& states,
           OrchestratorConfig config)
    : taskStore(tasks)
    , worktreeStore(worktrees)
    , runner(runner)
    , states(states)
    , config(std::move(config))
    , resolver(tasks)
    , provisioner(worktrees, git, MakeProvisionerConfig(this->config))
    , merger(git, worktrees, provisioner)
    , router(tasks, provisioner)
    , waiter(tasks) {
    if(runner) {
      spawner = std::make_unique<agents::AgentSpawner>(*runner);
      reconciler =
        std::make_unique<StatusReconciler>(tasks, worktrees, *runner);
    }
  }

  tasks::TaskStore& taskStore;
  worktree::WorktreeStore& worktreeStore;
  agents::AgentRunner* runner;
  state::StateDocumentStore& states;
  OrchestratorConfig config;

  tasks::TaskGraphResolver resolver;
  worktree::WorktreeProvisioner provisioner;
  MergeCoordinator merger;
  ReviewRouter router;
  WaitCoordinator waiter;
  std::unique_ptr<agents::AgentSpawner> spawner;
  std::unique_ptr<StatusReconciler> reconciler;

  /** @brief Applies the change and saves. On a version conflict the document
   * is read again and the change applied once more. */
  template<typename Apply>
  flot_status commit(const std::string& sessionId,
                     state::OrchestrationState& state,
                     Apply apply) {
    state::OrchestrationState next = state;
    apply(next);
    flot_status s = states.save(sessionId, next);
    if(s == FLOT_VERSION_CONFLICT) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALWARNING,
               "Session document {} changed concurrently, retrying write",
               sessionId);
      s = states.get(sessionId, next);
      if(s != FLOT_OK)
        return s;
      apply(next);
      s = states.save(sessionId, next);
    }
    if(s == FLOT_OK)
      state = std::move(next);
    return s;
  }

  /** @brief Undoes a worktree of a task that could not get a worker.
   * Reused worktrees keep their files, they hold an earlier attempt. */
  void discardWorktree(const worktree::Worktree& wt, bool reused) {
    flot_status s = provisioner.release(wt.id);
    if(s != FLOT_OK && s != FLOT_NOT_FOUND) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALERROR,
               "Could not release worktree {} after failed spawn: {}",
               wt.id,
               flot_status_to_str(s));
    }
    if(reused)
      return;
    s = provisioner.destroy(wt.id, true, true);
    if(s != FLOT_OK) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALERROR,
               "Could not destroy worktree {} after failed spawn: {}",
               wt.id,
               flot_status_to_str(s));
    }
  }
};

Orchestrator::Orchestrator(tasks::TaskStore& tasks,
                           worktree::WorktreeStore& worktrees,
                           worktree::GitOps& git,
                           agents::AgentRunner* runner,
                           state::StateDocumentStore& states,
                           OrchestratorConfig config)
  : m_internal(std::make_unique<Internal>(tasks,
                                          worktrees,
                                          git,
                                          runner,
                                          states,
                                          std::move(config))) {}
Orchestrator::~Orchestrator() {}

const OrchestratorConfig&
Orchestrator::config() const {
  return m_internal->config;
}

MergeOptions
Orchestrator::defaultMergeOptions() const {
  MergeOptions o;
  o.baseBranch = m_internal->config.baseBranch;
  o.remote = m_internal->config.remote;
  o.push = m_internal->config.pushAfterMerge;
  return o;
}

ReviewOptions
Orchestrator::defaultReviewOptions() const {
  ReviewOptions o;
  o.requireValidation = m_internal->config.requireValidation;
  o.maxValidationRetries = m_internal->config.maxValidationRetries;
  return o;
}

OrchestrateResult
Orchestrator::orchestrateReadyTasks(const std::string& parentTaskId,
                                    const std::string& parentSessionId,
                                    std::optional<uint32_t> maxConcurrent,
                                    const std::string& mode) {
  auto& i = *m_internal;
  OrchestrateResult result;
  result.parentTaskId = parentTaskId;
  result.maxConcurrent = maxConcurrent.value_or(i.config.maxConcurrent);

  auto fail = [&result](flot_status status, std::string error) {
    flot_log(FLOT_ORCHESTRATOR, FLOT_LOCALERROR, "{}", error);
    result.status = status;
    result.error = std::move(error);
    return result;
  };

  if(!i.runner)
    return fail(FLOT_NO_RUNNER,
                "Agent runner not configured. Cannot orchestrate.");
  if(parentSessionId.empty())
    return fail(FLOT_MISSING_SESSION,
                "parent_session_id is required for orchestration");

  const std::string modeStr = mode.empty() ? i.config.defaultMode : mode;
  auto spawnMode = agents::SpawnModeFromStr(modeStr);
  if(!spawnMode)
    return fail(FLOT_UNSUPPORTED_MODE,
                "Invalid mode '" + modeStr +
                  "'. Must be one of: terminal, embedded, headless");
  if(result.maxConcurrent == 0)
    return fail(FLOT_INVALID_ARGUMENT, "max_concurrent must be at least 1");

  auto ready = i.resolver.readyDescendants(parentTaskId);
  if(ready.status != FLOT_OK)
    return fail(ready.status, ready.error);

  auto sessionLock = SessionLocks::Process().lock(parentSessionId);

  state::OrchestrationState state;
  if(flot_status s = i.states.get(parentSessionId, state); s != FLOT_OK)
    return fail(s,
                "Could not read orchestration state of session " +
                  parentSessionId + ": " + flot_status_to_str(s));

  result.currentRunning = static_cast<uint32_t>(state.spawned.size());
  const uint32_t available = result.maxConcurrent > result.currentRunning
                               ? result.maxConcurrent - result.currentRunning
                               : 0;

  flot_log(FLOT_ORCHESTRATOR,
           FLOT_INFO,
           "Orchestrating {}: {} ready, {} running, {} slots free",
           parentTaskId,
           ready.ready.size(),
           result.currentRunning,
           available);

  if(ready.ready.empty())
    return result;

  auto check = i.spawner->check(parentSessionId);
  if(!check.ok) {
    flot_log(FLOT_ORCHESTRATOR,
             FLOT_LOCALWARNING,
             "Session {} may not spawn agents: {}",
             parentSessionId,
             check.reason);
    for(const auto& task : ready.ready)
      result.skipped.push_back({ task.id, "Cannot spawn: " + check.reason });
    return result;
  }

  bool persistenceBroken = false;
  for(const auto& task : ready.ready) {
    if(persistenceBroken) {
      result.skipped.push_back(
        { task.id, "Orchestration state could not be saved" });
      continue;
    }

    std::optional<worktree::Worktree> provisioned;
    bool reused = false;
    try {
      if(auto existing = i.worktreeStore.getByTask(task.id);
         existing && existing->owned()) {
        result.skipped.push_back(
          { task.id, "Already has active worktree: " + existing->id });
        continue;
      }

      if(result.spawned.size() >= available) {
        result.skipped.push_back({ task.id, "max_concurrent limit reached" });
        continue;
      }

      auto p = i.provisioner.provision(task);
      if(!p.success) {
        result.skipped.push_back({ task.id, p.reason });
        continue;
      }
      provisioned = p.worktree;
      reused = p.reused;

      auto outcome =
        i.spawner->spawn(*provisioned, task, parentSessionId, *spawnMode);
      if(!outcome.success) {
        i.discardWorktree(*provisioned, reused);
        result.skipped.push_back({ task.id, outcome.reason });
        continue;
      }

      flot_status s =
        i.provisioner.claim(provisioned->id, outcome.handle.sessionId);
      if(s != FLOT_OK) {
        flot_log(FLOT_ORCHESTRATOR,
                 FLOT_LOCALWARNING,
                 "Could not claim worktree {} for session {}: {}",
                 provisioned->id,
                 outcome.handle.sessionId,
                 flot_status_to_str(s));
      }

      auto agent = MakeSpawnedAgent(task, *provisioned, outcome.handle);
      s = i.commit(parentSessionId, state, [&agent](auto& st) {
        st.spawned.push_back(agent);
      });
      if(s != FLOT_OK) {
        flot_log(FLOT_ORCHESTRATOR,
                 FLOT_GLOBALERROR,
                 "Spawned agent {} for task {} but could not save session "
                 "{}: {}",
                 agent.sessionId,
                 task.id,
                 parentSessionId,
                 flot_status_to_str(s));
        result.status = s;
        result.error = "Could not save orchestration state";
        persistenceBroken = true;
      }
      result.spawned.push_back(std::move(agent));
    } catch(const std::exception& e) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALERROR,
               "Orchestrating task {} failed: {}",
               task.id,
               e.what());
      if(provisioned)
        i.discardWorktree(*provisioned, reused);
      result.skipped.push_back(
        { task.id, std::string("Unexpected error: ") + e.what() });
    }
  }

  flot_log(FLOT_ORCHESTRATOR,
           FLOT_INFO,
           "Orchestrated {}: spawned {}, skipped {}",
           parentTaskId,
           result.spawnedCount(),
           result.skippedCount());
  return result;
}

PollResult
Orchestrator::pollAgentStatus(const std::string& parentSessionId) {
  auto& i = *m_internal;
  PollResult result;
  if(!i.reconciler) {
    result.status = FLOT_NO_RUNNER;
    result.error = "Agent runner not configured. Cannot check agents.";
    return result;
  }
  if(parentSessionId.empty()) {
    result.status = FLOT_MISSING_SESSION;
    result.error = "parent_session_id is required";
    return result;
  }

  auto sessionLock = SessionLocks::Process().lock(parentSessionId);

  for(int attempt = 0; attempt < 2; ++attempt) {
    state::OrchestrationState state;
    flot_status s = i.states.get(parentSessionId, state);
    if(s != FLOT_OK) {
      result.status = s;
      result.error = "Could not read orchestration state";
      return result;
    }

    auto pass = i.reconciler->reconcile(std::move(state));
    if(!pass.changed())
      return std::move(pass.result);

    s = i.states.save(parentSessionId, pass.next);
    if(s == FLOT_OK)
      return std::move(pass.result);
    if(s != FLOT_VERSION_CONFLICT || attempt == 1) {
      result = std::move(pass.result);
      result.status = s;
      result.error = "Could not save orchestration state";
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALERROR,
               "Saving reconciled state of {} failed: {}",
               parentSessionId,
               flot_status_to_str(s));
      return result;
    }
    flot_log(FLOT_ORCHESTRATOR,
             FLOT_LOCALWARNING,
             "Session document {} changed concurrently, reconciling again",
             parentSessionId);
  }
  return result;
}

ReviewResult
Orchestrator::processCompletedAgents(const std::string& parentSessionId,
                                     const ReviewOptions& options) {
  auto& i = *m_internal;
  ReviewResult result;
  if(parentSessionId.empty()) {
    result.status = FLOT_MISSING_SESSION;
    result.error = "parent_session_id is required";
    return result;
  }

  auto sessionLock = SessionLocks::Process().lock(parentSessionId);

  state::OrchestrationState state;
  if(flot_status s = i.states.get(parentSessionId, state); s != FLOT_OK) {
    result.status = s;
    result.error = "Could not read orchestration state";
    return result;
  }

  result = i.router.route(state, options);

  if(flot_status s = i.states.save(parentSessionId, state); s != FLOT_OK) {
    flot_log(FLOT_ORCHESTRATOR,
             FLOT_LOCALERROR,
             "Saving reviewed state of {} failed: {}",
             parentSessionId,
             flot_status_to_str(s));
    result.status = s;
    result.error = "Could not save orchestration state";
  }
  return result;
}

CleanupResult
Orchestrator::cleanupReviewedWorktrees(const std::string& parentSessionId,
                                       const MergeOptions& options) {
  auto& i = *m_internal;
  CleanupResult result;
  if(parentSessionId.empty()) {
    result.status = FLOT_MISSING_SESSION;
    result.error = "parent_session_id is required";
    return result;
  }

  auto sessionLock = SessionLocks::Process().lock(parentSessionId);

  state::OrchestrationState state;
  if(flot_status s = i.states.get(parentSessionId, state); s != FLOT_OK) {
    result.status = s;
    result.error = "Could not read orchestration state";
    return result;
  }

  return i.merger.cleanup(
    state, options, [&i, &parentSessionId](state::OrchestrationState& st) {
      return i.states.save(parentSessionId, st);
    });
}

worktree::StaleCleanupResult
Orchestrator::cleanupStaleWorktrees(std::chrono::hours olderThan,
                                    bool dryRun) {
  return m_internal->provisioner.cleanupStale(olderThan, dryRun);
}

OrchestrationStatus
Orchestrator::getOrchestrationStatus(const std::string& parentTaskId,
                                     const std::string& parentSessionId) {
  auto& i = *m_internal;
  OrchestrationStatus result;
  result.parentTaskId = parentTaskId;

  if(!i.taskStore.get(parentTaskId)) {
    result.status = FLOT_NOT_FOUND;
    result.error = "Invalid parent_task_id: " + parentTaskId;
    return result;
  }

  state::OrchestrationState state;
  if(!parentSessionId.empty()) {
    auto sessionLock = SessionLocks::Process().lock(parentSessionId);
    if(flot_status s = i.states.get(parentSessionId, state); s != FLOT_OK) {
      result.status = s;
      result.error = "Could not read orchestration state";
      return result;
    }
  }

  auto children = i.taskStore.children(parentTaskId);
  std::sort(children.begin(),
            children.end(),
            [](const tasks::Task& a, const tasks::Task& b) {
              return std::tie(a.priority, a.createdAt, a.id) <
                     std::tie(b.priority, b.createdAt, b.id);
            });

  for(const auto& task : children) {
    auto s = MakeSubtaskStatus(task, i.worktreeStore, state);
    switch(task.status) {
      case tasks::TaskStatus::Open:
        result.open.push_back(std::move(s));
        break;
      case tasks::TaskStatus::InProgress:
        result.inProgress.push_back(std::move(s));
        break;
      case tasks::TaskStatus::Closed:
        result.closed.push_back(std::move(s));
        break;
      case tasks::TaskStatus::Failed:
        result.failed.push_back(std::move(s));
        break;
    }
  }

  result.spawnedAgents = state.spawned.size();
  result.completedAgents = state.completed.size();
  result.failedAgents = state.failed.size();
  result.reviewedAgents = state.reviewed.size();
  result.escalatedAgents = state.escalated.size();
  result.isComplete = result.closed.size() == children.size();
  return result;
}

WaitResult
Orchestrator::waitForTask(const std::string& taskId,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds pollInterval,
                          Cancellation* cancellation) {
  return m_internal->waiter.wait(taskId, timeout, pollInterval, cancellation);
}

WaitAnyResult
Orchestrator::waitForAnyTask(const std::vector<std::string>& taskIds,
                             std::chrono::milliseconds timeout,
                             std::chrono::milliseconds pollInterval,
                             Cancellation* cancellation) {
  return m_internal->waiter.waitAny(
    taskIds, timeout, pollInterval, cancellation);
}

WaitAllResult
Orchestrator::waitForAllTasks(const std::vector<std::string>& taskIds,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds pollInterval,
                              Cancellation* cancellation) {
  return m_internal->waiter.waitAll(
    taskIds, timeout, pollInterval, cancellation);
}
}
