#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/operations.hpp>

#include <cereal/archives/json.hpp>

#include <flotilla/agents/process_agent_runner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/orchestrator/cancellation.hpp>
#include <flotilla/orchestrator/orchestrator.hpp>
#include <flotilla/state/json_state_document_store.hpp>
#include <flotilla/tasks/json_task_store.hpp>
#include <flotilla/worktree/git_cli.hpp>
#include <flotilla/worktree/json_worktree_store.hpp>

#include "CLI.hpp"

using namespace flotilla;
namespace fs = boost::filesystem;

namespace {
struct ProgramRuntimeHelper {
  ProgramRuntimeHelper() {}
  ~ProgramRuntimeHelper() {
    auto dur = std::chrono::duration_cast<std::chrono::duration<float>>(
      std::chrono::steady_clock::now() - start);
    flot_log(
      FLOT_GENERAL, FLOT_DEBUG, "Wall-clock runtime: {}s", dur.count());
  }

  std::chrono::steady_clock::time_point start =
    std::chrono::steady_clock::now();
};

/** @brief Cancels the wait on SIGINT or SIGTERM, handled on its own
 * thread so the waiting thread is woken through the condition variable. */
class InterruptWatcher {
  public:
  explicit InterruptWatcher(flot::orchestrator::Cancellation& cancellation)
    : m_signals(m_io, SIGINT, SIGTERM) {
    m_signals.async_wait(
      [&cancellation](const boost::system::error_code& ec, int signal) {
        if(ec)
          return;
        flot_log(FLOT_GENERAL,
                 FLOT_INFO,
                 "Received signal {}, cancelling wait.",
                 signal);
        cancellation.cancel();
      });
    m_thread = std::thread([this] { m_io.run(); });
  }
  ~InterruptWatcher() {
    m_io.stop();
    m_thread.join();
  }

  private:
  boost::asio::io_context m_io;
  boost::asio::signal_set m_signals;
  std::thread m_thread;
};

template<typename T>
void
PrintResult(const T& result) {
  {
    cereal::JSONOutputArchive ar(std::cout);
    ar(cereal::make_nvp("result", result));
  }
  std::cout << std::endl;
}

template<typename T>
int
Finish(const T& result) {
  PrintResult(result);
  if(result.status != FLOT_OK) {
    flot_log(FLOT_GENERAL,
             FLOT_LOCALERROR,
             "Command failed with status {}: {}",
             flot_status_to_str(result.status),
             result.error);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

std::chrono::milliseconds
SecondsToMs(double seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

int
RunWait(flot::orchestrator::Orchestrator& o, const CLI& cli) {
  const auto& ids = cli.getTasks();
  if(ids.empty()) {
    std::cerr << "wait requires at least one --task!" << std::endl;
    return EXIT_FAILURE;
  }

  flot::orchestrator::Cancellation cancellation;
  InterruptWatcher watcher(cancellation);

  auto timeout = SecondsToMs(cli.getTimeoutSeconds());
  auto interval = SecondsToMs(cli.getPollIntervalSeconds());

  if(ids.size() == 1)
    return Finish(o.waitForTask(ids[0], timeout, interval, &cancellation));
  if(cli.waitAny())
    return Finish(o.waitForAnyTask(ids, timeout, interval, &cancellation));
  return Finish(o.waitForAllTasks(ids, timeout, interval, &cancellation));
}
}

int
main(int argc, char* argv[]) {
  // Workaround for wonky locales.
  try {
    std::locale loc("");
  } catch(const std::exception& e) {
    setenv("LC_ALL", "C", 1);
  }

  CLI cli;
  if(!cli.parseArgs(argc, argv)) {
    return cli.helpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if(flot_log_init() != FLOT_OK) {
    return EXIT_FAILURE;
  }

  ProgramRuntimeHelper runtimeHelper;

  if(cli.dumpConfig()) {
    PrintResult(cli.getConfig());
    return EXIT_SUCCESS;
  }

  // Workers terminated by the user must not take the orchestrator along.
  signal(SIGPIPE, SIG_IGN);

  const auto& config = cli.getConfig();
  const fs::path stateDir(cli.getStateDir());

  boost::system::error_code ec;
  fs::create_directories(stateDir / "sessions", ec);
  if(ec) {
    flot_log(FLOT_GENERAL,
             FLOT_FATAL,
             "Could not create state directory \"{}\": {}",
             stateDir.string(),
             ec.message());
    return EXIT_FAILURE;
  }

  flot::tasks::JsonTaskStore tasks(stateDir / "tasks.json");
  if(flot_status s = tasks.load(); s != FLOT_OK) {
    flot_log(FLOT_GENERAL,
             FLOT_FATAL,
             "Could not load tasks: {}",
             flot_status_to_str(s));
    return EXIT_FAILURE;
  }
  flot::worktree::JsonWorktreeStore worktrees(stateDir / "worktrees.json");
  if(flot_status s = worktrees.load(); s != FLOT_OK) {
    flot_log(FLOT_GENERAL,
             FLOT_FATAL,
             "Could not load worktrees: {}",
             flot_status_to_str(s));
    return EXIT_FAILURE;
  }
  flot::state::JsonStateDocumentStore states(stateDir / "sessions");

  flot::worktree::GitCli git(config.repoPath,
                             std::chrono::seconds(config.gitTimeoutSeconds));

  flot::agents::ProcessRunnerConfig runnerConfig;
  runnerConfig.command = config.agentCommand;
  runnerConfig.tmuxExecutable = config.tmuxExecutable;
  runnerConfig.maxDepth = config.maxAgentDepth;
  flot::agents::ProcessAgentRunner runner(stateDir / "runs.json",
                                          std::move(runnerConfig));

  flot::orchestrator::Orchestrator orchestrator(
    tasks, worktrees, git, &runner, states, config);

  const std::string& command = cli.getCommand();
  flot_log(FLOT_GENERAL,
           FLOT_DEBUG,
           "Running command {} with state in {}",
           command,
           stateDir.string());

  if(command == "orchestrate") {
    return Finish(orchestrator.orchestrateReadyTasks(cli.getParentTask(),
                                                     cli.getSession()));
  } else if(command == "poll") {
    return Finish(orchestrator.pollAgentStatus(cli.getSession()));
  } else if(command == "review") {
    return Finish(orchestrator.processCompletedAgents(
      cli.getSession(), orchestrator.defaultReviewOptions()));
  } else if(command == "cleanup") {
    return Finish(orchestrator.cleanupReviewedWorktrees(
      cli.getSession(), cli.getMergeOptions()));
  } else if(command == "cleanup-stale") {
    auto result = orchestrator.cleanupStaleWorktrees(
      std::chrono::hours(cli.getOlderThanHours()), cli.dryRun());
    PrintResult(result);
    return result.failed.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
  } else if(command == "wait") {
    return RunWait(orchestrator, cli);
  } else if(command == "status") {
    return Finish(orchestrator.getOrchestrationStatus(cli.getParentTask(),
                                                      cli.getSession()));
  }

  flot_log(
    FLOT_GENERAL, FLOT_FATAL, "Command {} is not implemented!", command);
  return EXIT_FAILURE;
}
