#include <flotilla/agents/agent_runner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/tasks/task_store.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/worktree_store.hpp>

#include "status_reconciler.hpp"

namespace flot::orchestrator {
using tasks::TaskStatus;

StatusReconciler::StatusReconciler(const tasks::TaskStore& tasks,
                                   const worktree::WorktreeStore& worktrees,
                                   agents::AgentRunner& runner)
  : m_tasks(tasks)
  , m_worktrees(worktrees)
  , m_runner(runner) {}
StatusReconciler::~StatusReconciler() {}

StatusReconciler::Classification
StatusReconciler::classify(const state::SpawnedAgent& agent) const {
  Classification c;

  if(!agent.validSessionId()) {
    c.reason = agent.sessionId.empty()
                 ? "Corrupted record: Missing session_id in agent record"
                 : "Corrupted record: Malformed session_id '" +
                     agent.sessionId + "'";
    return c;
  }
  if(agent.taskId.empty()) {
    c.reason = "Corrupted record: Missing task_id in agent record";
    return c;
  }

  auto task = m_tasks.get(agent.taskId);
  if(!task) {
    c.reason = "Task " + agent.taskId + " no longer exists";
    return c;
  }

  if(task->status == TaskStatus::Closed) {
    c.outcome = Outcome::Completed;
    c.completed.agent = agent;
    c.completed.completedAt = task->closedAt.value_or(util::NowIso());
    c.completed.closedReason = task->closedReason;
    c.completed.commitSha = task->closedCommitSha;
    return c;
  }

  if(m_runner.getRunning(agent.sessionId)) {
    c.outcome = Outcome::Running;
    return c;
  }

  switch(task->status) {
    case TaskStatus::Open:
      c.reason = "Agent exited before starting work";
      return c;
    case TaskStatus::InProgress: {
      std::optional<worktree::Worktree> wt;
      if(!agent.worktreeId.empty())
        wt = m_worktrees.get(agent.worktreeId);
      if(!wt || !wt->owned()) {
        c.reason = "Agent released worktree without closing task";
      } else {
        c.reason = "Agent exited without completing task";
      }
      return c;
    }
    case TaskStatus::Failed:
      c.reason = "Agent exited and task was marked failed";
      return c;
    case TaskStatus::Closed:
      break;
  }
  c.reason = "Unknown task status";
  return c;
}

ReconcilePass
StatusReconciler::reconcile(state::OrchestrationState current) const {
  ReconcilePass pass;
  pass.next = std::move(current);

  std::vector<state::SpawnedAgent> remaining;
  auto now = util::NowIso();

  for(auto& agent : pass.next.spawned) {
    Classification c;
    try {
      c = classify(agent);
    } catch(const std::exception& e) {
      c.outcome = Outcome::Failed;
      c.reason = std::string("Status check failed: ") + e.what();
    }

    switch(c.outcome) {
      case Outcome::Running:
        flot_log(FLOT_RECONCILER,
                 FLOT_TRACE,
                 "Agent {} on task {} still running",
                 agent.sessionId,
                 agent.taskId);
        pass.result.stillRunning.push_back(agent);
        remaining.push_back(agent);
        break;
      case Outcome::Completed:
        flot_log(FLOT_RECONCILER,
                 FLOT_INFO,
                 "Agent {} completed task {}{}",
                 agent.sessionId,
                 agent.taskId,
                 c.completed.commitSha ? " at " + *c.completed.commitSha
                                       : "");
        pass.next.completed.push_back(c.completed);
        pass.result.newlyCompleted.push_back(c.completed);
        break;
      case Outcome::Failed: {
        flot_log(FLOT_RECONCILER,
                 FLOT_LOCALWARNING,
                 "Agent {} on task {} failed: {}",
                 agent.sessionId,
                 agent.taskId,
                 c.reason);
        state::FailedAgent failed{ agent, now, c.reason };
        pass.next.failed.push_back(failed);
        pass.result.newlyFailed.push_back(std::move(failed));
        break;
      }
    }
  }

  pass.next.spawned = std::move(remaining);
  pass.result.allDone = pass.next.spawned.empty();

  flot_log(FLOT_RECONCILER,
           FLOT_DEBUG,
           "Reconciled: {} completed, {} failed, {} running",
           pass.result.newlyCompleted.size(),
           pass.result.newlyFailed.size(),
           pass.result.stillRunning.size());
  return pass;
}
}
