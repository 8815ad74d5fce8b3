#ifndef FLOTILLA_EXECUTABLE_CLI_HPP
#define FLOTILLA_EXECUTABLE_CLI_HPP

#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <flotilla/orchestrator/config.hpp>
#include <flotilla/orchestrator/options.hpp>

namespace flotilla {
class CLI {
  public:
  CLI();
  ~CLI();

  /** @brief Parses the command line and, if given, the config file.
   * Returns false if the program should exit right away. */
  bool parseArgs(int argc, char* argv[]);

  bool helpRequested() const { return m_help; }
  bool dumpConfig() const { return m_dumpConfig; }

  const std::string& getCommand() const { return m_command; }
  const std::string& getStateDir() const { return m_stateDir; }
  const std::string& getLocalName() const { return m_localName; }

  const flot::orchestrator::OrchestratorConfig& getConfig() const {
    return m_config;
  }

  const std::string& getParentTask() const { return m_parentTask; }
  const std::string& getSession() const { return m_session; }

  const std::vector<std::string>& getTasks() const { return m_tasks; }
  bool waitAny() const { return m_waitAny; }
  double getTimeoutSeconds() const { return m_timeoutSeconds; }
  double getPollIntervalSeconds() const { return m_pollIntervalSeconds; }

  flot::orchestrator::MergeOptions getMergeOptions() const;

  uint32_t getOlderThanHours() const { return m_olderThanHours; }
  bool dryRun() const { return m_dryRun; }

  void printHelp() const;

  private:
  boost::program_options::options_description m_globalOptions{
    "Global Options"
  };
  boost::program_options::options_description m_configOptions{
    "Configuration (also readable from --config file)"
  };
  boost::program_options::options_description m_commandOptions{
    "Command Options"
  };

  boost::program_options::variables_map m_vm;

  flot::orchestrator::OrchestratorConfig m_config;

  std::string m_command;
  std::string m_configFile;
  std::string m_stateDir;
  std::string m_localName;

  std::string m_parentTask;
  std::string m_session;

  std::vector<std::string> m_tasks;
  bool m_waitAny = false;
  double m_timeoutSeconds = 300;
  double m_pollIntervalSeconds = 5;

  bool m_noMerge = false;
  bool m_keepWorktrees = false;
  bool m_keepBranches = false;
  bool m_noPush = false;
  bool m_force = false;

  uint32_t m_olderThanHours = 24;
  bool m_dryRun = false;

  bool m_help = false;
  bool m_dumpConfig = false;
  bool m_traceMode = false;
  bool m_debugMode = false;
  bool m_infoMode = false;
};
}

#endif
