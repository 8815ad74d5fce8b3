#ifndef FLOTILLA_STATE_ORCHESTRATION_STATE_HPP
#define FLOTILLA_STATE_ORCHESTRATION_STATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace flot::state {
/** @brief Reads a field that may be absent or of the wrong type in documents
 * written by older or foreign writers. The value is left empty then. */
template<class Archive, typename T>
void
LoadTolerant(Archive& ar, const char* name, T& value) {
  try {
    ar(cereal::make_nvp(name, value));
  } catch(const std::exception& e) {
    value = T{};
  }
}

/** @brief A worker that was launched and has not been classified yet. */
struct SpawnedAgent {
  std::string sessionId;
  std::string runId;
  std::string taskId;
  std::string worktreeId;
  std::string title;
  std::string branchName;
  std::string worktreePath;
  int64_t pid = 0;
  std::string spawnedAt;

  /** @brief False if the session id is missing or can not be one. */
  bool validSessionId() const;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("session_id", sessionId),
       cereal::make_nvp("run_id", runId),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("worktree_id", worktreeId),
       cereal::make_nvp("title", title),
       cereal::make_nvp("branch_name", branchName),
       cereal::make_nvp("worktree_path", worktreePath),
       cereal::make_nvp("pid", pid),
       cereal::make_nvp("spawned_at", spawnedAt));
  }

  template<class Archive>
  void load(Archive& ar) {
    LoadTolerant(ar, "session_id", sessionId);
    LoadTolerant(ar, "run_id", runId);
    LoadTolerant(ar, "task_id", taskId);
    LoadTolerant(ar, "worktree_id", worktreeId);
    LoadTolerant(ar, "title", title);
    LoadTolerant(ar, "branch_name", branchName);
    LoadTolerant(ar, "worktree_path", worktreePath);
    LoadTolerant(ar, "pid", pid);
    LoadTolerant(ar, "spawned_at", spawnedAt);
  }
};

struct CompletedAgent {
  SpawnedAgent agent;
  std::string completedAt;
  std::optional<std::string> closedReason;
  std::optional<std::string> commitSha;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("agent", agent),
       cereal::make_nvp("completed_at", completedAt),
       cereal::make_nvp("closed_reason", closedReason),
       cereal::make_nvp("commit_sha", commitSha));
  }
};

struct FailedAgent {
  SpawnedAgent agent;
  std::string failedAt;
  std::string reason;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("agent", agent),
       cereal::make_nvp("failed_at", failedAt),
       cereal::make_nvp("reason", reason));
  }
};

/** @brief Approved work, waiting to be merged into the base branch. */
struct ReviewedAgent {
  std::string sessionId;
  std::string taskId;
  std::string worktreeId;
  std::string branchName;
  std::string reviewedAt;

  bool operator==(const ReviewedAgent& o) const {
    return sessionId == o.sessionId && taskId == o.taskId &&
           worktreeId == o.worktreeId && branchName == o.branchName;
  }

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("session_id", sessionId),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("worktree_id", worktreeId),
       cereal::make_nvp("branch_name", branchName),
       cereal::make_nvp("reviewed_at", reviewedAt));
  }

  template<class Archive>
  void load(Archive& ar) {
    LoadTolerant(ar, "session_id", sessionId);
    LoadTolerant(ar, "task_id", taskId);
    LoadTolerant(ar, "worktree_id", worktreeId);
    LoadTolerant(ar, "branch_name", branchName);
    LoadTolerant(ar, "reviewed_at", reviewedAt);
  }
};

/** @brief Work that needs a human, it is never retried automatically. */
struct EscalatedAgent {
  SpawnedAgent agent;
  std::string reason;
  std::string escalatedAt;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("agent", agent),
       cereal::make_nvp("reason", reason),
       cereal::make_nvp("escalated_at", escalatedAt));
  }
};

struct CleanupHistoryEntry {
  std::string worktreeId;
  std::string branchName;
  std::string taskId;
  bool merged = false;
  std::optional<std::string> mergeCommit;
  std::string cleanedAt;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("worktree_id", worktreeId),
       cereal::make_nvp("branch_name", branchName),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("merged", merged),
       cereal::make_nvp("merge_commit", mergeCommit),
       cereal::make_nvp("cleaned_at", cleanedAt));
  }
};

/** @brief Progress of one orchestrating session.
 *
 * The only persisted record of which workers exist and where they are in
 * their lifecycle. It is read once per pass, changed as a value and written
 * back once. version is owned by the StateDocumentStore.
 */
struct OrchestrationState {
  uint64_t version = 0;
  std::vector<SpawnedAgent> spawned;
  std::vector<CompletedAgent> completed;
  std::vector<FailedAgent> failed;
  std::vector<ReviewedAgent> reviewed;
  std::vector<EscalatedAgent> escalated;
  std::vector<CleanupHistoryEntry> cleanupHistory;

  bool tracksSpawnedTask(const std::string& taskId) const;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("version", version),
       cereal::make_nvp("spawned_agents", spawned),
       cereal::make_nvp("completed_agents", completed),
       cereal::make_nvp("failed_agents", failed),
       cereal::make_nvp("reviewed_agents", reviewed),
       cereal::make_nvp("escalated_agents", escalated),
       cereal::make_nvp("cleanup_history", cleanupHistory));
  }

  template<class Archive>
  void load(Archive& ar) {
    ar(cereal::make_nvp("version", version),
       cereal::make_nvp("spawned_agents", spawned),
       cereal::make_nvp("completed_agents", completed),
       cereal::make_nvp("failed_agents", failed),
       cereal::make_nvp("reviewed_agents", reviewed));
    LoadTolerant(ar, "escalated_agents", escalated);
    LoadTolerant(ar, "cleanup_history", cleanupHistory);
  }
};
}

#endif
