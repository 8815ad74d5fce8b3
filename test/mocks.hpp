#pragma once

#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <flotilla/agents/agent_runner.hpp>
#include <flotilla/common/log.h>
#include <flotilla/state/state_document_store.hpp>
#include <flotilla/tasks/json_task_store.hpp>
#include <flotilla/util/random.hpp>
#include <flotilla/worktree/git_ops.hpp>

namespace flot::test {
/** @brief Temporary directory removed again at the end of a test. */
class TempDir {
  public:
  TempDir()
    : m_path(boost::filesystem::temp_directory_path() /
             ("flotilla-test-" + util::RandomHex(12))) {
    boost::filesystem::create_directories(m_path);
  }
  ~TempDir() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(m_path, ec);
  }

  const boost::filesystem::path& path() const { return m_path; }
  std::string str() const { return m_path.string(); }

  private:
  boost::filesystem::path m_path;
};

inline void
InitTestLogging() {
  static bool initialized = false;
  if(!initialized) {
    flot_log_init();
    initialized = true;
  }
}

inline tasks::Task
MakeTask(std::string id,
         std::string parent = "",
         int priority = 2,
         tasks::TaskStatus status = tasks::TaskStatus::Open,
         std::string createdAt = "2024-01-01T00:00:00.000000Z") {
  tasks::Task t;
  t.id = std::move(id);
  t.title = "Task " + t.id;
  if(!parent.empty())
    t.parentId = std::move(parent);
  t.priority = priority;
  t.status = status;
  t.createdAt = std::move(createdAt);
  return t;
}

/** @brief Git without a repository. Worktrees are plain directories, every
 * call is recorded. */
class FakeGitOps : public worktree::GitOps {
  public:
  explicit FakeGitOps(std::string repoPath = "/nonexistent/repo")
    : m_repoPath(std::move(repoPath)) {}

  const std::string& repoPath() const override { return m_repoPath; }

  worktree::GitResult createWorktree(const std::string& path,
                                     const std::string& branch,
                                     const std::string& baseBranch,
                                     bool createBranch) override {
    record("worktree add " + branch + " " + path);
    if(failCreate)
      return worktree::GitResult::fail("Failed to create worktree: " +
                                         createError,
                                       createError);
    if(boost::filesystem::exists(path))
      return worktree::GitResult::fail("Worktree path already exists: " +
                                       path);
    boost::filesystem::create_directories(
      boost::filesystem::path(path).parent_path());
    if(createAsFile) {
      std::ofstream(path) << "not a directory";
    } else {
      boost::filesystem::create_directories(path);
    }
    branches.insert(branch);
    (void)baseBranch;
    (void)createBranch;
    return worktree::GitResult::ok("Created worktree at " + path);
  }

  worktree::GitResult deleteWorktree(const std::string& path,
                                     bool force) override {
    record(std::string("worktree remove ") + (force ? "--force " : "") +
           path);
    if(failDelete)
      return worktree::GitResult::fail("Failed to remove worktree");
    boost::system::error_code ec;
    boost::filesystem::remove_all(path, ec);
    return worktree::GitResult::ok("Deleted worktree at " + path);
  }

  worktree::GitResult deleteBranch(const std::string& branch) override {
    record("branch -D " + branch);
    if(failDeleteBranch)
      return worktree::GitResult::fail("Delete branch failed");
    branches.erase(branch);
    return worktree::GitResult::ok("Deleted branch " + branch);
  }

  bool hasRemote(const std::string& remote) override {
    record("remote " + remote);
    return remoteExists;
  }

  worktree::GitResult fetch(const std::string& remote,
                            const std::string& branch) override {
    record("fetch " + remote + " " + branch);
    return worktree::GitResult::ok("fetched");
  }

  worktree::GitResult checkout(const std::string& branch) override {
    record("checkout " + branch);
    return worktree::GitResult::ok("checked out " + branch);
  }

  worktree::GitResult pull(const std::string& remote,
                           const std::string& branch) override {
    record("pull " + remote + " " + branch);
    return worktree::GitResult::ok("pulled");
  }

  worktree::GitResult merge(const std::string& branch,
                            const std::string& message) override {
    record("merge " + branch);
    (void)message;
    if(conflictingBranches.count(branch)) {
      worktree::GitResult r;
      r.success = false;
      r.message = "Merge failed";
      r.output = "CONFLICT (content): Merge conflict in main.cpp";
      return r;
    }
    ++m_merges;
    return worktree::GitResult::ok("Merged " + branch);
  }

  worktree::GitResult mergeAbort() override {
    record("merge --abort");
    return worktree::GitResult::ok("aborted");
  }

  worktree::GitResult revParse(const std::string& ref) override {
    record("rev-parse " + ref);
    return worktree::GitResult::ok("", "c0ffee" + std::to_string(m_merges));
  }

  worktree::GitResult push(const std::string& remote,
                           const std::string& branch) override {
    record("push " + remote + " " + branch);
    if(failPush)
      return worktree::GitResult::fail("rejected");
    return worktree::GitResult::ok("pushed");
  }

  size_t count(const std::string& prefix) const {
    std::lock_guard lock(m_mutex);
    size_t n = 0;
    for(auto& c : calls) {
      if(c.compare(0, prefix.size(), prefix) == 0)
        ++n;
    }
    return n;
  }

  bool failCreate = false;
  std::string createError = "fatal: invalid reference: main";
  bool createAsFile = false;
  bool failDelete = false;
  bool failDeleteBranch = false;
  bool failPush = false;
  bool remoteExists = false;
  std::set<std::string> conflictingBranches;
  std::set<std::string> branches;
  std::vector<std::string> calls;

  private:
  void record(std::string call) {
    std::lock_guard lock(m_mutex);
    calls.push_back(std::move(call));
  }

  std::string m_repoPath;
  int m_merges = 0;
  mutable std::mutex m_mutex;
};

/** @brief Runner handing out sequential session ids. Workers are alive
 * until removed from the alive set. */
class FakeAgentRunner : public agents::AgentRunner {
  public:
  agents::SpawnCheck canSpawn(const std::string& parentSessionId) override {
    (void)parentSessionId;
    if(!refuseReason.empty())
      return { false, refuseReason, 2 };
    return { true, "", 1 };
  }

  agents::SpawnResult spawn(const agents::SpawnRequest& request) override {
    requests.push_back(request);
    if(throwOnSpawn.count(request.taskId))
      throw std::runtime_error("runner exploded");
    if(failSpawn.count(request.taskId))
      return { false, "terminal not available", {} };

    agents::AgentHandle h;
    h.sessionId = "sess-" + std::to_string(++m_counter);
    h.runId = "run-" + std::to_string(m_counter);
    h.pid = 1000 + m_counter;
    h.mode = request.mode;
    alive.insert(h.sessionId);
    return { true, "", h };
  }

  std::optional<agents::AgentHandle> getRunning(
    const std::string& sessionId) override {
    if(throwOnCheck.count(sessionId))
      throw std::runtime_error("registry unreadable");
    if(!alive.count(sessionId))
      return std::nullopt;
    agents::AgentHandle h;
    h.sessionId = sessionId;
    return h;
  }

  std::string refuseReason;
  std::set<std::string> failSpawn;
  std::set<std::string> throwOnSpawn;
  std::set<std::string> throwOnCheck;
  std::set<std::string> alive;
  std::vector<agents::SpawnRequest> requests;

  private:
  int m_counter = 0;
};

/** @brief Versioned in-memory session documents. */
class FakeStateDocumentStore : public state::StateDocumentStore {
  public:
  flot_status get(const std::string& sessionId,
                  state::OrchestrationState& state) override {
    auto it = documents.find(sessionId);
    state = it == documents.end() ? state::OrchestrationState{} : it->second;
    return FLOT_OK;
  }

  flot_status save(const std::string& sessionId,
                   state::OrchestrationState& state) override {
    ++saves;
    if(failSaves)
      return FLOT_IO_ERROR;
    auto& stored = documents[sessionId];
    if(interleave) {
      // Another writer gets in between our read and this save.
      auto writer = std::move(interleave);
      interleave = nullptr;
      writer(stored);
      ++stored.version;
    }
    if(stored.version != state.version)
      return FLOT_VERSION_CONFLICT;
    ++state.version;
    stored = state;
    return FLOT_OK;
  }

  std::map<std::string, state::OrchestrationState> documents;
  std::function<void(state::OrchestrationState&)> interleave;
  bool failSaves = false;
  size_t saves = 0;
};
}
