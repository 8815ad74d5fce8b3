#include <boost/filesystem/operations.hpp>

#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <flotilla/agents/process_agent_runner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/util/json_file.hpp>
#include <flotilla/util/process.hpp>
#include <flotilla/util/random.hpp>
#include <flotilla/util/timestamp.hpp>

namespace flot::agents {
struct ProcessAgentRunner::RunRecord {
  std::string sessionId;
  std::string runId;
  std::string parentSessionId;
  uint32_t depth = 0;
  int64_t pid = 0;
  std::string mode;
  std::string taskId;
  std::string workdir;
  std::string startedAt;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("session_id", sessionId),
       cereal::make_nvp("run_id", runId),
       cereal::make_nvp("parent_session_id", parentSessionId),
       cereal::make_nvp("depth", depth),
       cereal::make_nvp("pid", pid),
       cereal::make_nvp("mode", mode),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("workdir", workdir),
       cereal::make_nvp("started_at", startedAt));
  }
};

namespace {
using RunRecord = ProcessAgentRunner::RunRecord;

std::vector<RunRecord>
LoadRuns(const boost::filesystem::path& registry) {
  std::vector<RunRecord> runs;
  flot_status s = util::LoadJson(registry, "runs", runs);
  if(s != FLOT_OK && s != FLOT_FILE_NOT_FOUND_ERROR) {
    flot_log(FLOT_SPAWNER,
             FLOT_LOCALERROR,
             "Run registry {} unreadable, continuing without history",
             registry.string());
    runs.clear();
  }
  return runs;
}

const RunRecord*
FindRun(const std::vector<RunRecord>& runs, const std::string& sessionId) {
  for(const auto& r : runs) {
    if(r.sessionId == sessionId)
      return &r;
  }
  return nullptr;
}

std::string
TmuxSessionName(const std::string& sessionId) {
  return "flotilla-" + sessionId;
}
}

ProcessAgentRunner::ProcessAgentRunner(boost::filesystem::path registry,
                                       ProcessRunnerConfig config)
  : m_registry(std::move(registry))
  , m_config(std::move(config)) {}
ProcessAgentRunner::~ProcessAgentRunner() {}

uint32_t
ProcessAgentRunner::depthOf(const std::vector<RunRecord>& runs,
                            const std::string& sessionId) const {
  const RunRecord* r = FindRun(runs, sessionId);
  return r ? r->depth : 0;
}

SpawnCheck
ProcessAgentRunner::canSpawn(const std::string& parentSessionId) {
  std::lock_guard lock(m_mutex);
  auto runs = LoadRuns(m_registry);
  SpawnCheck check;
  check.depth = depthOf(runs, parentSessionId) + 1;
  if(check.depth > m_config.maxDepth) {
    check.ok = false;
    check.reason = "Max agent depth " + std::to_string(m_config.maxDepth) +
                   " exceeded (would be " + std::to_string(check.depth) + ")";
    return check;
  }
  if(m_config.command.empty()) {
    check.reason = "No agent command configured";
    return check;
  }
  check.ok = true;
  return check;
}

std::vector<std::string>
ProcessAgentRunner::buildCommand(const SpawnRequest& request,
                                 const std::string& sessionId) const {
  std::vector<std::string> argv{
    "env",
    "FLOT_SESSION_ID=" + sessionId,
    "FLOT_PARENT_SESSION_ID=" + request.parentSessionId,
    "FLOT_TASK_ID=" + request.taskId,
    "FLOT_WORKTREE_ID=" + request.worktreeId,
  };
  bool promptPlaced = false;
  for(const auto& arg : m_config.command) {
    if(arg == "{prompt}") {
      argv.push_back(request.prompt);
      promptPlaced = true;
    } else {
      argv.push_back(arg);
    }
  }
  if(!promptPlaced)
    argv.push_back(request.prompt);
  return argv;
}

SpawnResult
ProcessAgentRunner::spawn(const SpawnRequest& request) {
  std::lock_guard lock(m_mutex);
  SpawnResult result;

  auto runs = LoadRuns(m_registry);

  RunRecord run;
  run.sessionId = util::RandomId("sess", 12);
  run.runId = util::RandomId("run", 12);
  run.parentSessionId = request.parentSessionId;
  run.depth = depthOf(runs, request.parentSessionId) + 1;
  run.mode = SpawnModeToStr(request.mode);
  run.taskId = request.taskId;
  run.workdir = request.workdir;
  run.startedAt = util::NowIso();

  auto command = buildCommand(request, run.sessionId);
  std::string error;

  switch(request.mode) {
    case SpawnMode::Headless: {
      auto log = boost::filesystem::path(request.workdir) / m_config.logFile;
      boost::system::error_code ec;
      boost::filesystem::create_directories(log.parent_path(), ec);
      run.pid =
        util::SpawnDetached(command, request.workdir, log.string(), error);
      break;
    }
    case SpawnMode::Embedded:
      run.pid = util::SpawnDetached(command, request.workdir, "", error);
      break;
    case SpawnMode::Terminal: {
      std::vector<std::string> tmux{ m_config.tmuxExecutable,
                                     "new-session",
                                     "-d",
                                     "-s",
                                     TmuxSessionName(run.sessionId),
                                     "-c",
                                     request.workdir };
      tmux.insert(tmux.end(), command.begin(), command.end());
      auto r = util::RunProcess(tmux, { request.workdir,
                                        std::chrono::seconds(30) });
      if(!r.ok()) {
        error = r.error.empty() ? "tmux: " + r.err : r.error;
        run.pid = -1;
      }
      break;
    }
  }

  if(run.pid < 0) {
    result.error = error;
    flot_log(FLOT_SPAWNER,
             FLOT_LOCALERROR,
             "Could not start worker for task {}: {}",
             request.taskId,
             error);
    return result;
  }

  runs.push_back(run);
  if(util::SaveJson(m_registry, "runs", runs) != FLOT_OK) {
    flot_log(FLOT_SPAWNER,
             FLOT_LOCALWARNING,
             "Worker {} started but could not be recorded in {}",
             run.sessionId,
             m_registry.string());
  }

  result.success = true;
  result.handle.sessionId = run.sessionId;
  result.handle.runId = run.runId;
  result.handle.pid = run.pid;
  result.handle.mode = request.mode;
  return result;
}

bool
ProcessAgentRunner::alive(const RunRecord& run) const {
  if(run.mode == SpawnModeToStr(SpawnMode::Terminal)) {
    auto r = util::RunProcess({ m_config.tmuxExecutable,
                                "has-session",
                                "-t",
                                TmuxSessionName(run.sessionId) },
                              { "", std::chrono::seconds(10) });
    return r.ok();
  }
  return util::IsProcessAlive(static_cast<pid_t>(run.pid));
}

std::optional<AgentHandle>
ProcessAgentRunner::getRunning(const std::string& sessionId) {
  std::lock_guard lock(m_mutex);
  auto runs = LoadRuns(m_registry);
  const RunRecord* run = FindRun(runs, sessionId);
  if(!run || !alive(*run))
    return std::nullopt;

  AgentHandle h;
  h.sessionId = run->sessionId;
  h.runId = run->runId;
  h.pid = run->pid;
  h.mode = SpawnModeFromStr(run->mode).value_or(SpawnMode::Headless);
  return h;
}
}
