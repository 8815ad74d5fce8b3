#include "CLI.hpp"

#include <fstream>
#include <iostream>

#include <unistd.h>

#include <boost/asio/ip/host_name.hpp>
#include <boost/program_options.hpp>

#include <flotilla/common/log.h>

namespace po = boost::program_options;

namespace flotilla {
namespace {
const char* const Commands[] = { "orchestrate", "poll",   "review", "cleanup",
                                 "cleanup-stale", "wait", "status" };

bool
IsKnownCommand(const std::string& command) {
  for(const char* c : Commands) {
    if(command == c)
      return true;
  }
  return false;
}
}

CLI::CLI() {
  std::string generatedLocalName =
    boost::asio::ip::host_name() + "_" + std::to_string(getpid());

  auto& c = m_config;

  // clang-format off
  m_globalOptions.add_options()
    ("help", "produce help message for all available options")
    ("command", po::value<std::string>(&m_command)->value_name("string"), "one of orchestrate, poll, review, cleanup, cleanup-stale, wait, status")
    ("config", po::value<std::string>(&m_configFile)->value_name("file"), "INI style file with configuration options")
    ("state-dir", po::value<std::string>(&m_stateDir)->default_value(".flotilla/state")->value_name("dir"), "directory of tasks.json, worktrees.json, runs.json and sessions/")
    ("local-name,n", po::value<std::string>(&m_localName)->default_value(generatedLocalName)->value_name("string"), "name of this orchestrator in logs")
    ("trace,t", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= TRACE)")
    ("debug,d", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= DEBG)")
    ("info,i", po::bool_switch(&m_infoMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= INFO)")
    ("dump-config", po::bool_switch(&m_dumpConfig)->default_value(false)->value_name("bool"), "print the effective configuration as JSON and exit")
    ;

  m_configOptions.add_options()
    ("repo", po::value<std::string>(&c.repoPath)->default_value(c.repoPath)->value_name("path"), "main git repository")
    ("project", po::value<std::string>(&c.project)->default_value(c.project)->value_name("string"), "project name, part of worktree paths")
    ("base-branch", po::value<std::string>(&c.baseBranch)->default_value(c.baseBranch)->value_name("string"), "branch worktrees start from and merge into")
    ("remote", po::value<std::string>(&c.remote)->default_value(c.remote)->value_name("string"), "remote to fetch, pull and push")
    ("worktree-root", po::value<std::string>(&c.worktreeRoot)->default_value(c.worktreeRoot)->value_name("dir"), "directory holding all worktrees")
    ("project-config-dir", po::value<std::string>(&c.projectConfigDir)->default_value(c.projectConfigDir)->value_name("dir"), "repository relative directory with project.json and hooks/")
    ("agent-command", po::value<std::vector<std::string>>(&c.agentCommand)->default_value(c.agentCommand, "claude {prompt}")->multitoken()->value_name("string"), "worker command, {prompt} is replaced by the task prompt")
    ("tmux", po::value<std::string>(&c.tmuxExecutable)->default_value(c.tmuxExecutable)->value_name("string"), "tmux executable for terminal mode")
    ("max-agent-depth", po::value<uint32_t>(&c.maxAgentDepth)->default_value(c.maxAgentDepth)->value_name("int"), "maximum nesting depth of spawned agents")
    ("max-concurrent", po::value<uint32_t>(&c.maxConcurrent)->default_value(c.maxConcurrent)->value_name("int"), "maximum running agents per session")
    ("mode", po::value<std::string>(&c.defaultMode)->default_value(c.defaultMode)->value_name("string"), "spawn mode: terminal, embedded or headless")
    ("require-validation", po::value<bool>(&c.requireValidation)->default_value(c.requireValidation)->value_name("bool"), "only merge work whose task validated")
    ("max-validation-retries", po::value<uint32_t>(&c.maxValidationRetries)->default_value(c.maxValidationRetries)->value_name("int"), "retries after failed validation before escalating")
    ("push-after-merge", po::value<bool>(&c.pushAfterMerge)->default_value(c.pushAfterMerge)->value_name("bool"), "push the base branch after merging")
    ("git-timeout", po::value<uint32_t>(&c.gitTimeoutSeconds)->default_value(c.gitTimeoutSeconds)->value_name("seconds"), "timeout of a single git call")
    ("stale-after", po::value<uint32_t>(&c.staleAfterHours)->default_value(c.staleAfterHours)->value_name("hours"), "age of unowned worktrees considered stale")
    ;

  m_commandOptions.add_options()
    ("parent-task,p", po::value<std::string>(&m_parentTask)->value_name("id"), "task whose subtasks are orchestrated")
    ("session,s", po::value<std::string>(&m_session)->value_name("id"), "session id of the orchestrating agent")
    ("task", po::value<std::vector<std::string>>(&m_tasks)->multitoken()->value_name("id"), "tasks to wait for")
    ("any", po::bool_switch(&m_waitAny)->default_value(false)->value_name("bool"), "wait until any of the tasks finished")
    ("timeout", po::value<double>(&m_timeoutSeconds)->default_value(m_timeoutSeconds)->value_name("seconds"), "maximum time to wait")
    ("poll-interval", po::value<double>(&m_pollIntervalSeconds)->default_value(m_pollIntervalSeconds)->value_name("seconds"), "time between two status checks while waiting")
    ("no-merge", po::bool_switch(&m_noMerge)->default_value(false)->value_name("bool"), "cleanup without merging into the base branch")
    ("keep-worktrees", po::bool_switch(&m_keepWorktrees)->default_value(false)->value_name("bool"), "cleanup without deleting worktrees")
    ("keep-branches", po::bool_switch(&m_keepBranches)->default_value(false)->value_name("bool"), "cleanup without deleting branches")
    ("no-push", po::bool_switch(&m_noPush)->default_value(false)->value_name("bool"), "do not push after merging")
    ("force", po::bool_switch(&m_force)->default_value(false)->value_name("bool"), "remove worktrees with uncommitted changes")
    ("older-than", po::value<uint32_t>(&m_olderThanHours)->value_name("hours"), "cleanup-stale age, defaults to --stale-after")
    ("dry-run", po::bool_switch(&m_dryRun)->default_value(false)->value_name("bool"), "only list stale worktrees")
    ;
  // clang-format on
}
CLI::~CLI() {}

void
CLI::printHelp() const {
  std::cout << "Usage: flotilla <command> [options]\n\n"
            << m_globalOptions << m_configOptions << m_commandOptions
            << std::endl;
}

bool
CLI::parseArgs(int argc, char* argv[]) {
  po::positional_options_description positionalOptions;
  positionalOptions.add("command", 1);

  po::options_description options;
  options.add(m_globalOptions).add(m_configOptions).add(m_commandOptions);

  try {
    po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positionalOptions)
                .run(),
              m_vm);

    // Values given on the command line take precedence over the file.
    if(m_vm.count("config")) {
      const auto file = m_vm["config"].as<std::string>();
      std::ifstream in(file);
      if(!in) {
        std::cerr << "Could not open config file \"" << file << "\"!"
                  << std::endl;
        return false;
      }
      po::store(po::parse_config_file(in, m_configOptions), m_vm);
    }
    po::notify(m_vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    return false;
  }

  if(m_vm.count("help")) {
    m_help = true;
    printHelp();
    return false;
  }

  if(m_infoMode) {
    flot_log_set_severity(FLOT_INFO);
  }
  if(m_debugMode) {
    flot_log_set_severity(FLOT_DEBUG);
  }
  if(m_traceMode) {
    flot_log_set_severity(FLOT_TRACE);
  }

  flot_log_set_local_name(m_localName.c_str());

  if(!m_vm.count("older-than")) {
    m_olderThanHours = m_config.staleAfterHours;
  }

  if(m_dumpConfig)
    return true;

  if(m_command.empty()) {
    std::cerr << "No command given! Use --help for usage." << std::endl;
    return false;
  }
  if(!IsKnownCommand(m_command)) {
    std::cerr << "Unknown command \"" << m_command
              << "\"! Use --help for usage." << std::endl;
    return false;
  }

  return true;
}

flot::orchestrator::MergeOptions
CLI::getMergeOptions() const {
  flot::orchestrator::MergeOptions o;
  o.mergeToBase = !m_noMerge;
  o.deleteWorktrees = !m_keepWorktrees;
  o.deleteBranches = !m_keepBranches;
  o.push = m_config.pushAfterMerge && !m_noPush;
  o.force = m_force;
  o.baseBranch = m_config.baseBranch;
  o.remote = m_config.remote;
  return o;
}
}
