#ifndef FLOTILLA_TASKS_TASK_HPP
#define FLOTILLA_TASKS_TASK_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>

namespace flot::tasks {
enum class TaskStatus { Open, InProgress, Closed, Failed };

enum class ValidationStatus { None, Pending, Valid, Invalid };

const char*
TaskStatusToStr(TaskStatus status);
std::optional<TaskStatus>
TaskStatusFromStr(std::string_view str);

const char*
ValidationStatusToStr(ValidationStatus status);
std::optional<ValidationStatus>
ValidationStatusFromStr(std::string_view str);

inline bool
IsTerminal(TaskStatus status) {
  return status == TaskStatus::Closed || status == TaskStatus::Failed;
}

struct Task {
  std::string id;
  std::string title;
  TaskStatus status = TaskStatus::Open;
  std::optional<std::string> parentId;
  int32_t priority = 2;
  std::string type = "task";
  std::string description;
  std::string testStrategy;
  std::string validationCriteria;

  /// ISO 8601 timestamps, lexically ordered.
  std::string createdAt;
  std::optional<std::string> closedAt;
  std::optional<std::string> closedReason;
  std::optional<std::string> closedCommitSha;

  ValidationStatus validationStatus = ValidationStatus::None;
  uint32_t validationFailCount = 0;

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("id", id),
       cereal::make_nvp("title", title),
       cereal::make_nvp("status", std::string(TaskStatusToStr(status))),
       cereal::make_nvp("parent_id", parentId),
       cereal::make_nvp("priority", priority),
       cereal::make_nvp("type", type),
       cereal::make_nvp("description", description),
       cereal::make_nvp("test_strategy", testStrategy),
       cereal::make_nvp("validation_criteria", validationCriteria),
       cereal::make_nvp("created_at", createdAt),
       cereal::make_nvp("closed_at", closedAt),
       cereal::make_nvp("closed_reason", closedReason),
       cereal::make_nvp("closed_commit_sha", closedCommitSha),
       cereal::make_nvp("validation_status",
                        std::string(ValidationStatusToStr(validationStatus))),
       cereal::make_nvp("validation_fail_count", validationFailCount));
  }

  template<class Archive>
  void load(Archive& ar) {
    std::string statusStr, validationStr;
    ar(cereal::make_nvp("id", id),
       cereal::make_nvp("title", title),
       cereal::make_nvp("status", statusStr),
       cereal::make_nvp("parent_id", parentId),
       cereal::make_nvp("priority", priority),
       cereal::make_nvp("type", type),
       cereal::make_nvp("description", description),
       cereal::make_nvp("test_strategy", testStrategy),
       cereal::make_nvp("validation_criteria", validationCriteria),
       cereal::make_nvp("created_at", createdAt),
       cereal::make_nvp("closed_at", closedAt),
       cereal::make_nvp("closed_reason", closedReason),
       cereal::make_nvp("closed_commit_sha", closedCommitSha),
       cereal::make_nvp("validation_status", validationStr),
       cereal::make_nvp("validation_fail_count", validationFailCount));
    status = TaskStatusFromStr(statusStr).value_or(TaskStatus::Open);
    validationStatus =
      ValidationStatusFromStr(validationStr).value_or(ValidationStatus::None);
  }
};

/** @brief Edge stating that taskId can not start before dependsOn is closed.
 */
struct TaskDependency {
  std::string taskId;
  std::string dependsOn;
  std::string kind = "blocks";

  bool blocks() const { return kind == "blocks"; }

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("depends_on", dependsOn),
       cereal::make_nvp("kind", kind));
  }
};
}

inline std::ostream&
operator<<(std::ostream& o, flot::tasks::TaskStatus status) {
  return o << flot::tasks::TaskStatusToStr(status);
}

#endif
