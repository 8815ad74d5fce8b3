#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>

#include <flotilla/common/log.h>
#include <flotilla/util/process.hpp>
#include <flotilla/worktree/git_cli.hpp>

namespace flot::worktree {
GitCli::GitCli(std::string repoPath, std::chrono::seconds timeout)
  : m_repoPath(std::move(repoPath))
  , m_timeout(timeout) {}
GitCli::~GitCli() {}

GitResult
GitCli::run(const std::vector<std::string>& args,
            const std::string& what,
            const std::string& cwd) {
  std::vector<std::string> argv{ "git" };
  argv.insert(argv.end(), args.begin(), args.end());

  util::ProcessOptions options;
  options.cwd = cwd.empty() ? m_repoPath : cwd;
  options.timeout = m_timeout;

  flot_log(FLOT_GIT,
           FLOT_TRACE,
           "Running git {} in {}",
           fmt::join(args, " "),
           options.cwd);

  auto r = util::RunProcess(argv, options);
  if(!r.started) {
    return GitResult::fail(what + " failed: " + r.error, r.error);
  }
  if(r.timedOut) {
    flot_log(FLOT_GIT, FLOT_LOCALERROR, "git {} timed out", args.front());
    return GitResult::fail(what + " timed out", r.err);
  }
  if(r.exitCode != 0) {
    flot_log(FLOT_GIT,
             FLOT_DEBUG,
             "git {} exited with {}: {}",
             args.front(),
             r.exitCode,
             boost::algorithm::trim_copy(r.err));
    GitResult res =
      GitResult::fail(what + " failed: " + boost::algorithm::trim_copy(r.err),
                      r.err);
    res.output = r.out;
    return res;
  }
  return GitResult::ok(what, r.out);
}

GitResult
GitCli::createWorktree(const std::string& path,
                       const std::string& branch,
                       const std::string& baseBranch,
                       bool createBranch) {
  boost::system::error_code ec;
  if(boost::filesystem::exists(path, ec)) {
    return GitResult::fail("Worktree path already exists: " + path);
  }
  boost::filesystem::create_directories(
    boost::filesystem::path(path).parent_path(), ec);

  std::vector<std::string> args{ "worktree", "add" };
  if(createBranch) {
    args.insert(args.end(), { "-b", branch, path, baseBranch });
  } else {
    args.insert(args.end(), { path, branch });
  }
  auto r = run(args, "Create worktree");
  if(!r.success) {
    r.message = "Failed to create worktree: " + r.message;
    return r;
  }
  r.message = "Created worktree at " + path + " on branch " + branch;
  return r;
}

GitResult
GitCli::deleteWorktree(const std::string& path, bool force) {
  boost::system::error_code ec;
  if(boost::filesystem::exists(path, ec)) {
    std::vector<std::string> args{ "worktree", "remove" };
    if(force)
      args.push_back("--force");
    args.push_back(path);
    auto r = run(args, "Remove worktree");
    if(!r.success)
      return r;
  } else {
    // Drop administrative files of worktrees deleted behind our back.
    auto r = run({ "worktree", "prune" }, "Prune worktrees");
    if(!r.success)
      return r;
  }
  return GitResult::ok("Deleted worktree " + path);
}

GitResult
GitCli::deleteBranch(const std::string& branch) {
  // -D, branches are deleted after their work was merged or on purpose
  // discarded.
  auto r = run({ "branch", "-D", branch }, "Delete branch");
  if(!r.success && r.error.find("not found") != std::string::npos)
    return GitResult::ok("Branch " + branch + " already deleted");
  return r;
}

bool
GitCli::hasRemote(const std::string& remote) {
  return run({ "remote", "get-url", remote }, "Query remote").success;
}

GitResult
GitCli::fetch(const std::string& remote, const std::string& branch) {
  return run({ "fetch", remote, branch }, "Fetch " + remote + "/" + branch);
}

GitResult
GitCli::checkout(const std::string& branch) {
  return run({ "checkout", branch }, "Checkout " + branch);
}

GitResult
GitCli::pull(const std::string& remote, const std::string& branch) {
  return run({ "pull", remote, branch }, "Pull " + remote + "/" + branch);
}

GitResult
GitCli::merge(const std::string& branch, const std::string& message) {
  return run({ "merge", branch, "--no-ff", "-m", message }, "Merge " + branch);
}

GitResult
GitCli::mergeAbort() {
  return run({ "merge", "--abort" }, "Abort merge");
}

GitResult
GitCli::revParse(const std::string& ref) {
  auto r = run({ "rev-parse", ref }, "Resolve " + ref);
  if(r.success)
    boost::algorithm::trim(r.output);
  return r;
}

GitResult
GitCli::push(const std::string& remote, const std::string& branch) {
  return run({ "push", remote, branch }, "Push " + remote + "/" + branch);
}
}
