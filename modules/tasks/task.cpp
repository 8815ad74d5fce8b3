#include <flotilla/tasks/task.hpp>

namespace flot::tasks {
const char*
TaskStatusToStr(TaskStatus status) {
  switch(status) {
    case TaskStatus::Open:
      return "open";
    case TaskStatus::InProgress:
      return "in_progress";
    case TaskStatus::Closed:
      return "closed";
    case TaskStatus::Failed:
      return "failed";
  }
  return "unknown";
}

std::optional<TaskStatus>
TaskStatusFromStr(std::string_view str) {
  if(str == "open")
    return TaskStatus::Open;
  if(str == "in_progress")
    return TaskStatus::InProgress;
  if(str == "closed")
    return TaskStatus::Closed;
  if(str == "failed")
    return TaskStatus::Failed;
  return std::nullopt;
}

const char*
ValidationStatusToStr(ValidationStatus status) {
  switch(status) {
    case ValidationStatus::None:
      return "none";
    case ValidationStatus::Pending:
      return "pending";
    case ValidationStatus::Valid:
      return "valid";
    case ValidationStatus::Invalid:
      return "invalid";
  }
  return "unknown";
}

std::optional<ValidationStatus>
ValidationStatusFromStr(std::string_view str) {
  if(str == "none" || str.empty())
    return ValidationStatus::None;
  if(str == "pending")
    return ValidationStatus::Pending;
  if(str == "valid")
    return ValidationStatus::Valid;
  if(str == "invalid")
    return ValidationStatus::Invalid;
  return std::nullopt;
}
}
