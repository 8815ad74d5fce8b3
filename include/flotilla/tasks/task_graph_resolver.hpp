#ifndef FLOTILLA_TASKS_TASK_GRAPH_RESOLVER_HPP
#define FLOTILLA_TASKS_TASK_GRAPH_RESOLVER_HPP

#include <string>
#include <vector>

#include "flotilla/common/status.h"
#include "flotilla/tasks/task.hpp"

namespace flot::tasks {
class TaskStore;

/** @brief Computes which descendants of a task may be started right now.
 *
 * A descendant is ready if it is open, no "blocks" edge points from it to a
 * task that is not closed, and neither the parent nor any ancestor in between
 * is blocked that way. Only the subtree below the parent is traversed, a
 * blocker outside of it counts by its own status. Blockers that can not be
 * found are treated as blocking.
 */
class TaskGraphResolver {
  public:
  explicit TaskGraphResolver(const TaskStore& store);
  ~TaskGraphResolver();

  struct Result {
    flot_status status = FLOT_OK;
    std::string error;
    std::vector<Task> ready;
  };

  /** @brief Ready descendants, parents before their children, otherwise by
   * priority and then creation time (both ascending). */
  Result readyDescendants(const std::string& parentId) const;

  /** @brief True if any "blocks" edge of the task points to a task that is
   * not closed. */
  bool blocked(const Task& task) const;

  private:
  const TaskStore& m_store;
};
}

#endif
