#ifndef FLOTILLA_ORCHESTRATOR_RESULTS_HPP
#define FLOTILLA_ORCHESTRATOR_RESULTS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>

#include "flotilla/common/status.h"
#include "flotilla/state/orchestration_state.hpp"
#include "flotilla/tasks/task.hpp"
#include "flotilla/worktree/worktree.hpp"

/** @file
 * Outcomes of the orchestrator operations. status is FLOT_OK unless the whole
 * call was rejected, per-item problems are listed in the item vectors. The
 * serialize functions produce the JSON printed by the command line driver.
 */

namespace flot::orchestrator {
struct SkippedTask {
  std::string taskId;
  std::string reason;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("task_id", taskId), cereal::make_nvp("reason", reason));
  }
};

struct OrchestrateResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::string parentTaskId;
  std::vector<state::SpawnedAgent> spawned;
  std::vector<SkippedTask> skipped;
  uint32_t currentRunning = 0;
  uint32_t maxConcurrent = 0;

  bool success() const { return status == FLOT_OK; }
  size_t spawnedCount() const { return spawned.size(); }
  size_t skippedCount() const { return skipped.size(); }

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", success()),
       cereal::make_nvp("error", error),
       cereal::make_nvp("parent_task_id", parentTaskId),
       cereal::make_nvp("spawned", spawned),
       cereal::make_nvp("skipped", skipped),
       cereal::make_nvp("spawned_count", spawnedCount()),
       cereal::make_nvp("skipped_count", skippedCount()),
       cereal::make_nvp("current_running", currentRunning),
       cereal::make_nvp("max_concurrent", maxConcurrent));
  }
};

struct PollResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::vector<state::CompletedAgent> newlyCompleted;
  std::vector<state::FailedAgent> newlyFailed;
  std::vector<state::SpawnedAgent> stillRunning;
  bool allDone = false;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("newly_completed", newlyCompleted),
       cereal::make_nvp("newly_failed", newlyFailed),
       cereal::make_nvp("still_running", stillRunning),
       cereal::make_nvp("all_done", allDone));
  }
};

struct ReviewResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::vector<state::ReviewedAgent> reviewed;
  std::vector<SkippedTask> retried;
  std::vector<state::EscalatedAgent> escalated;
  /** @brief Completed work still waiting for validation. */
  std::vector<std::string> awaitingValidation;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("reviewed", reviewed),
       cereal::make_nvp("retried", retried),
       cereal::make_nvp("escalated", escalated),
       cereal::make_nvp("awaiting_validation", awaitingValidation));
  }
};

struct MergedAgent {
  state::ReviewedAgent agent;
  std::optional<std::string> mergeCommit;
  bool worktreeDeleted = false;
  /** @brief The worktree record was already gone, nothing was merged. */
  bool alreadyCleaned = false;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("agent", agent),
       cereal::make_nvp("merge_commit", mergeCommit),
       cereal::make_nvp("worktree_deleted", worktreeDeleted),
       cereal::make_nvp("already_cleaned", alreadyCleaned));
  }
};

struct MergeFailure {
  state::ReviewedAgent agent;
  std::string reason;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("agent", agent), cereal::make_nvp("reason", reason));
  }
};

struct CleanupResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::vector<MergedAgent> merged;
  std::vector<MergeFailure> failed;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("merged", merged),
       cereal::make_nvp("failed", failed),
       cereal::make_nvp("merged_count", merged.size()),
       cereal::make_nvp("failed_count", failed.size()));
  }
};

struct WaitResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::string taskId;
  bool completed = false;
  bool timedOut = false;
  bool cancelled = false;
  std::chrono::milliseconds waitTime{ 0 };
  std::optional<tasks::TaskStatus> finalStatus;

  template<class Archive>
  void save(Archive& ar) const {
    std::optional<std::string> statusStr;
    if(finalStatus)
      statusStr = tasks::TaskStatusToStr(*finalStatus);
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("completed", completed),
       cereal::make_nvp("timed_out", timedOut),
       cereal::make_nvp("cancelled", cancelled),
       cereal::make_nvp("wait_time_seconds", waitTime.count() / 1000.0),
       cereal::make_nvp("final_status", statusStr));
  }
};

struct WaitAnyResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::optional<std::string> completedTaskId;
  bool timedOut = false;
  bool cancelled = false;
  std::chrono::milliseconds waitTime{ 0 };

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("completed_task_id", completedTaskId),
       cereal::make_nvp("timed_out", timedOut),
       cereal::make_nvp("cancelled", cancelled),
       cereal::make_nvp("wait_time_seconds", waitTime.count() / 1000.0));
  }
};

struct WaitAllResult {
  flot_status status = FLOT_OK;
  std::string error;
  std::vector<std::string> completed;
  std::vector<std::string> pending;
  bool allCompleted = false;
  bool timedOut = false;
  bool cancelled = false;
  std::chrono::milliseconds waitTime{ 0 };

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("completed", completed),
       cereal::make_nvp("pending", pending),
       cereal::make_nvp("all_completed", allCompleted),
       cereal::make_nvp("timed_out", timedOut),
       cereal::make_nvp("cancelled", cancelled),
       cereal::make_nvp("wait_time_seconds", waitTime.count() / 1000.0));
  }
};

struct SubtaskStatus {
  tasks::Task task;
  std::optional<worktree::Worktree> worktree;
  bool hasActiveAgent = false;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("task", task),
       cereal::make_nvp("worktree", worktree),
       cereal::make_nvp("has_active_agent", hasActiveAgent));
  }
};

struct OrchestrationStatus {
  flot_status status = FLOT_OK;
  std::string error;
  std::string parentTaskId;
  std::vector<SubtaskStatus> open;
  std::vector<SubtaskStatus> inProgress;
  std::vector<SubtaskStatus> closed;
  std::vector<SubtaskStatus> failed;
  size_t spawnedAgents = 0;
  size_t completedAgents = 0;
  size_t failedAgents = 0;
  size_t reviewedAgents = 0;
  size_t escalatedAgents = 0;
  bool isComplete = false;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("success", status == FLOT_OK),
       cereal::make_nvp("error", error),
       cereal::make_nvp("parent_task_id", parentTaskId),
       cereal::make_nvp("open", open),
       cereal::make_nvp("in_progress", inProgress),
       cereal::make_nvp("closed", closed),
       cereal::make_nvp("failed", failed),
       cereal::make_nvp("spawned_agents", spawnedAgents),
       cereal::make_nvp("completed_agents", completedAgents),
       cereal::make_nvp("failed_agents", failedAgents),
       cereal::make_nvp("reviewed_agents", reviewedAgents),
       cereal::make_nvp("escalated_agents", escalatedAgents),
       cereal::make_nvp("is_complete", isComplete));
  }
};
}

#endif
