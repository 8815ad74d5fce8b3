#include <sstream>

#include <flotilla/agents/agent_spawner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/tasks/task.hpp>
#include <flotilla/worktree/worktree.hpp>

namespace flot::agents {
const char*
SpawnModeToStr(SpawnMode mode) {
  switch(mode) {
    case SpawnMode::Terminal:
      return "terminal";
    case SpawnMode::Embedded:
      return "embedded";
    case SpawnMode::Headless:
      return "headless";
  }
  return "unknown";
}

std::optional<SpawnMode>
SpawnModeFromStr(std::string_view str) {
  if(str == "terminal")
    return SpawnMode::Terminal;
  if(str == "embedded")
    return SpawnMode::Embedded;
  if(str == "headless")
    return SpawnMode::Headless;
  return std::nullopt;
}

AgentSpawner::AgentSpawner(AgentRunner& runner)
  : m_runner(runner) {}
AgentSpawner::~AgentSpawner() {}

std::string
AgentSpawner::BuildPrompt(const tasks::Task& task) {
  std::stringstream p;
  p << "You are working on task " << task.id << ": " << task.title << "\n";
  if(!task.description.empty()) {
    p << "\n## Description\n" << task.description << "\n";
  }
  if(!task.testStrategy.empty()) {
    p << "\n## Test Strategy\n" << task.testStrategy << "\n";
  }
  if(!task.validationCriteria.empty()) {
    p << "\n## Validation Criteria\n" << task.validationCriteria << "\n";
  }
  p << "\n## Instructions\n"
    << "1. Mark the task as in_progress before you start.\n"
    << "2. Implement the task in this worktree, it is your own branch.\n"
    << "3. Commit your changes with a message referencing " << task.id
    << ".\n"
    << "4. Close the task with the commit SHA when done.\n"
    << "5. Stop after closing the task, do not pick up other work.\n";
  return p.str();
}

SpawnCheck
AgentSpawner::check(const std::string& parentSessionId) {
  try {
    return m_runner.canSpawn(parentSessionId);
  } catch(const std::exception& e) {
    flot_log(FLOT_SPAWNER,
             FLOT_LOCALERROR,
             "Agent runner failed to answer spawn check for {}: {}",
             parentSessionId,
             e.what());
    return SpawnCheck{ false, std::string("spawn check failed: ") + e.what(),
                       0 };
  }
}

SpawnOutcome
AgentSpawner::spawn(const worktree::Worktree& worktree,
                    const tasks::Task& task,
                    const std::string& parentSessionId,
                    SpawnMode mode) {
  SpawnOutcome outcome;

  SpawnRequest req;
  req.parentSessionId = parentSessionId;
  req.taskId = task.id;
  req.title = task.title;
  req.worktreeId = worktree.id;
  req.workdir = worktree.path;
  req.prompt = BuildPrompt(task);
  req.mode = mode;

  SpawnResult r;
  try {
    r = m_runner.spawn(req);
  } catch(const std::exception& e) {
    outcome.reason = std::string("Spawn failed: ") + e.what();
    flot_log(FLOT_SPAWNER, FLOT_LOCALERROR, "{}", outcome.reason);
    return outcome;
  }

  if(!r.success) {
    outcome.reason = "Spawn failed: " + r.error;
    flot_log(FLOT_SPAWNER,
             FLOT_LOCALWARNING,
             "Could not spawn agent for task {}: {}",
             task.id,
             r.error);
    return outcome;
  }
  if(r.handle.sessionId.empty()) {
    outcome.reason = "Spawn failed: runner returned no session id";
    flot_log(FLOT_SPAWNER, FLOT_LOCALERROR, "{}", outcome.reason);
    return outcome;
  }

  flot_log(FLOT_SPAWNER,
           FLOT_INFO,
           "Spawned agent session {} (run {}, pid {}) in {} mode for task {}",
           r.handle.sessionId,
           r.handle.runId,
           r.handle.pid,
           SpawnModeToStr(mode),
           task.id);

  outcome.success = true;
  outcome.handle = r.handle;
  return outcome;
}
}
