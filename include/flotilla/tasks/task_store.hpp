#ifndef FLOTILLA_TASKS_TASK_STORE_HPP
#define FLOTILLA_TASKS_TASK_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "flotilla/common/status.h"
#include "flotilla/tasks/task.hpp"

namespace flot::tasks {
/** @brief Storage of tasks and their dependency edges.
 *
 * Implementations must be safe to call from multiple threads.
 */
class TaskStore {
  public:
  virtual ~TaskStore() = default;

  virtual std::optional<Task> get(const std::string& id) const = 0;

  /** @brief Direct children of a task, in no particular order. */
  virtual std::vector<Task> children(const std::string& parentId) const = 0;

  /** @brief All edges where the given task is the dependent side. */
  virtual std::vector<TaskDependency> dependencies(
    const std::string& taskId) const = 0;

  virtual flot_status updateStatus(const std::string& id,
                                   TaskStatus status) = 0;

  /** @brief Close a task. Refused with FLOT_INVALID_ARGUMENT while the task
   * still has non-closed children, unless force is set. */
  virtual flot_status close(const std::string& id,
                            const std::string& reason,
                            const std::optional<std::string>& commitSha,
                            bool force = false) = 0;

  virtual flot_status setValidation(const std::string& id,
                                    ValidationStatus status,
                                    uint32_t failCount) = 0;
};
}

#endif
