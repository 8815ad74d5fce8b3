#include <flotilla/common/log.h>
#include <flotilla/tasks/task_store.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>

#include "review_router.hpp"

namespace flot::orchestrator {
namespace {
bool
IsRetryableFailure(const std::string& reason) {
  for(const char* marker : { "exited", "released", "crashed" }) {
    if(reason.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

state::ReviewedAgent
ToReviewed(const state::SpawnedAgent& agent) {
  state::ReviewedAgent r;
  r.sessionId = agent.sessionId;
  r.taskId = agent.taskId;
  r.worktreeId = agent.worktreeId;
  r.branchName = agent.branchName;
  r.reviewedAt = util::NowIso();
  return r;
}
}

ReviewRouter::ReviewRouter(tasks::TaskStore& tasks,
                           worktree::WorktreeProvisioner& provisioner)
  : m_tasks(tasks)
  , m_provisioner(provisioner) {}
ReviewRouter::~ReviewRouter() {}

bool
ReviewRouter::retry(const state::SpawnedAgent& agent, std::string& error) {
  flot_status s = m_tasks.updateStatus(agent.taskId, tasks::TaskStatus::Open);
  if(s != FLOT_OK) {
    error = "Could not reopen task " + agent.taskId + ": " +
            flot_status_to_str(s);
    return false;
  }
  if(!agent.worktreeId.empty()) {
    s = m_provisioner.release(agent.worktreeId);
    if(s != FLOT_OK && s != FLOT_NOT_FOUND) {
      error = "Could not release worktree " + agent.worktreeId + ": " +
              flot_status_to_str(s);
      return false;
    }
  }
  return true;
}

ReviewResult
ReviewRouter::route(state::OrchestrationState& state,
                    const ReviewOptions& options) {
  ReviewResult result;
  const auto now = util::NowIso();

  std::vector<state::CompletedAgent> keptCompleted;
  for(auto& completed : state.completed) {
    const auto& agent = completed.agent;
    auto task = m_tasks.get(agent.taskId);

    if(!options.requireValidation ||
       (task && task->validationStatus == tasks::ValidationStatus::Valid)) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_INFO,
               "Task {} on branch {} is ready to merge",
               agent.taskId,
               agent.branchName);
      auto reviewed = ToReviewed(agent);
      state.reviewed.push_back(reviewed);
      result.reviewed.push_back(std::move(reviewed));
      continue;
    }

    if(!task) {
      state::EscalatedAgent e{ agent,
                               "Task " + agent.taskId + " no longer exists",
                               now };
      state.escalated.push_back(e);
      result.escalated.push_back(std::move(e));
      continue;
    }

    if(task->validationStatus != tasks::ValidationStatus::Invalid) {
      result.awaitingValidation.push_back(agent.taskId);
      keptCompleted.push_back(std::move(completed));
      continue;
    }

    if(task->validationFailCount >= options.maxValidationRetries) {
      std::string reason =
        fmt::format("Validation failed {} times, giving up after {} retries",
                    task->validationFailCount,
                    options.maxValidationRetries);
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALWARNING,
               "Escalating task {}: {}",
               agent.taskId,
               reason);
      state::EscalatedAgent e{ agent, std::move(reason), now };
      state.escalated.push_back(e);
      result.escalated.push_back(std::move(e));
      continue;
    }

    std::string error;
    if(!retry(agent, error)) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_LOCALERROR,
               "Retry of task {} failed: {}",
               agent.taskId,
               error);
      state::EscalatedAgent e{ agent, std::move(error), now };
      state.escalated.push_back(e);
      result.escalated.push_back(std::move(e));
      continue;
    }
    flot_log(FLOT_ORCHESTRATOR,
             FLOT_INFO,
             "Task {} failed validation ({} of {}), reopened for retry",
             agent.taskId,
             task->validationFailCount,
             options.maxValidationRetries);
    result.retried.push_back({ agent.taskId, "Validation failed" });
  }
  state.completed = std::move(keptCompleted);

  for(auto& failed : state.failed) {
    const auto& agent = failed.agent;
    auto task = agent.taskId.empty() ? std::nullopt : m_tasks.get(agent.taskId);
    const bool retryable =
      task &&
      (task->status == tasks::TaskStatus::InProgress ||
       task->status == tasks::TaskStatus::Open) &&
      IsRetryableFailure(failed.reason);

    std::string error;
    if(retryable && retry(agent, error)) {
      flot_log(FLOT_ORCHESTRATOR,
               FLOT_INFO,
               "Task {} reopened after worker failure: {}",
               agent.taskId,
               failed.reason);
      result.retried.push_back({ agent.taskId, failed.reason });
      continue;
    }

    std::string reason = error.empty() ? failed.reason
                                       : failed.reason + " (" + error + ")";
    flot_log(FLOT_ORCHESTRATOR,
             FLOT_LOCALWARNING,
             "Escalating failed agent {} for task {}: {}",
             agent.sessionId,
             agent.taskId,
             reason);
    state::EscalatedAgent e{ agent, std::move(reason), now };
    state.escalated.push_back(e);
    result.escalated.push_back(std::move(e));
  }
  state.failed.clear();

  return result;
}
}
