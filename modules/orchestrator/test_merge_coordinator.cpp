#include <catch2/catch.hpp>

#include <flotilla/worktree/json_worktree_store.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>

#include "../../test/mocks.hpp"
#include "merge_coordinator.hpp"

using namespace flot;
using namespace flot::orchestrator;
using flot::test::FakeGitOps;
using flot::test::MakeTask;
using flot::test::TempDir;

namespace {
struct MergeFixture {
  TempDir root;
  worktree::JsonWorktreeStore worktrees;
  FakeGitOps git;
  worktree::WorktreeProvisioner provisioner{ worktrees, git, config() };
  MergeCoordinator merger{ git, worktrees, provisioner };
  size_t persists = 0;
  MergeCoordinator::Persist persist = [this](state::OrchestrationState&) {
    ++persists;
    return FLOT_OK;
  };

  worktree::ProvisionerConfig config() const {
    worktree::ProvisionerConfig c;
    c.project = "demo";
    c.worktreeRoot = (root.path() / "worktrees").string();
    return c;
  }

  state::ReviewedAgent review(const std::string& taskId) {
    auto r = provisioner.provision(MakeTask(taskId));
    REQUIRE(r.success);
    state::ReviewedAgent a;
    a.sessionId = "sess-" + taskId;
    a.taskId = taskId;
    a.worktreeId = r.worktree->id;
    a.branchName = r.worktree->branchName;
    return a;
  }
};
}

TEST_CASE("Merge Coordinator: Partial batch", "[orchestrator][merge]") {
  MergeFixture f;
  state::OrchestrationState s;
  auto first = f.review("t1");
  auto second = f.review("t2");
  s.reviewed = { first, second };
  f.git.conflictingBranches.insert(second.branchName);

  auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);

  REQUIRE(r.status == FLOT_OK);
  REQUIRE(r.merged.size() == 1);
  REQUIRE(r.merged[0].agent.taskId == "t1");
  REQUIRE(r.merged[0].mergeCommit == std::string("c0ffee1"));
  REQUIRE(r.merged[0].worktreeDeleted);

  REQUIRE(r.failed.size() == 1);
  REQUIRE(r.failed[0].agent.taskId == "t2");
  REQUIRE(r.failed[0].reason.find("Merge conflict") == 0);
  REQUIRE(f.git.count("merge --abort") == 1);

  REQUIRE(s.reviewed.size() == 1);
  REQUIRE(s.reviewed[0] == second);
  REQUIRE(s.cleanupHistory.size() == 1);
  REQUIRE(s.cleanupHistory[0].merged);
  REQUIRE(s.cleanupHistory[0].taskId == "t1");
  REQUIRE(f.persists == 1);

  REQUIRE(!f.worktrees.get(first.worktreeId));
  REQUIRE(f.worktrees.get(second.worktreeId));

  SECTION("Repeating the cleanup fails the same record once more") {
    auto again = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(again.merged.empty());
    REQUIRE(again.failed.size() == 1);
    REQUIRE(again.failed[0].agent.taskId == "t2");
    REQUIRE(s.reviewed.size() == 1);
  }

  SECTION("Resolved conflicts merge on the next run") {
    f.git.conflictingBranches.clear();
    auto again = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(again.merged.size() == 1);
    REQUIRE(again.failed.empty());
    REQUIRE(s.reviewed.empty());
  }
}

TEST_CASE("Merge Coordinator: Record handling", "[orchestrator][merge]") {
  MergeFixture f;
  state::OrchestrationState s;

  SECTION("Missing worktree id") {
    state::ReviewedAgent a;
    a.sessionId = "sess-x";
    a.taskId = "x";
    s.reviewed.push_back(a);
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.failed.size() == 1);
    REQUIRE(r.failed[0].reason.find("Missing worktree_id") != std::string::npos);
    REQUIRE(s.reviewed.size() == 1);
    REQUIRE(f.persists == 0);
  }

  SECTION("Already cleaned worktrees are dropped without merging") {
    auto a = f.review("t1");
    REQUIRE(f.provisioner.destroy(a.worktreeId) == FLOT_OK);
    s.reviewed.push_back(a);
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.merged.size() == 1);
    REQUIRE(r.merged[0].alreadyCleaned);
    REQUIRE(s.reviewed.empty());
    REQUIRE(f.git.count("merge") == 0);
  }

  SECTION("Failed push only warns") {
    f.git.remoteExists = true;
    f.git.failPush = true;
    s.reviewed.push_back(f.review("t1"));
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.merged.size() == 1);
    REQUIRE(r.failed.empty());
    REQUIRE(f.git.count("fetch") == 1);
    REQUIRE(f.git.count("pull") == 1);
    REQUIRE(f.git.count("push") == 1);
  }

  SECTION("Without a remote nothing is fetched or pushed") {
    s.reviewed.push_back(f.review("t1"));
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.merged.size() == 1);
    REQUIRE(f.git.count("fetch") == 0);
    REQUIRE(f.git.count("push") == 0);
  }

  SECTION("Keeping worktrees without merging") {
    auto a = f.review("t1");
    s.reviewed.push_back(a);
    MergeOptions o;
    o.mergeToBase = false;
    o.deleteWorktrees = false;
    auto r = f.merger.cleanup(s, o, f.persist);
    REQUIRE(r.merged.size() == 1);
    REQUIRE(!r.merged[0].mergeCommit);
    REQUIRE(!r.merged[0].worktreeDeleted);
    REQUIRE(f.worktrees.get(a.worktreeId));
    REQUIRE(f.git.count("merge") == 0);
  }

  SECTION("Failed deletion keeps the record") {
    auto a = f.review("t1");
    s.reviewed.push_back(a);
    f.git.failDelete = true;
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.failed.size() == 1);
    REQUIRE(r.failed[0].reason.find("Failed to delete worktree") == 0);
    REQUIRE(s.reviewed.size() == 1);
    REQUIRE(s.cleanupHistory.size() == 1);
    REQUIRE(f.persists == 1);
  }

  SECTION("Persistence failures stop the batch") {
    s.reviewed = { f.review("t1"), f.review("t2") };
    f.persist = [](state::OrchestrationState&) { return FLOT_IO_ERROR; };
    auto r = f.merger.cleanup(s, MergeOptions{}, f.persist);
    REQUIRE(r.status == FLOT_IO_ERROR);
    REQUIRE(r.merged.size() == 1);
    REQUIRE(f.git.count("merge t") == 1);
  }
}

TEST_CASE("Merge Coordinator: Deleting without merging",
          "[orchestrator][merge]") {
  MergeFixture f;
  state::OrchestrationState s;
  auto a = f.review("t1");
  s.reviewed.push_back(a);

  MergeOptions o;
  o.mergeToBase = false;

  SECTION("Worktree, branch and record are removed") {
    auto r = f.merger.cleanup(s, o, f.persist);
    REQUIRE(r.failed.empty());
    REQUIRE(r.merged.size() == 1);
    REQUIRE(r.merged[0].worktreeDeleted);
    REQUIRE(s.reviewed.empty());
    REQUIRE(!f.worktrees.get(a.worktreeId));
    REQUIRE(f.git.count("merge") == 0);
    REQUIRE(f.git.count("worktree remove --force") == 0);
    REQUIRE(f.git.count("branch -D task/t1") == 1);
    REQUIRE(f.git.branches.count("task/t1") == 0);
  }

  SECTION("A failed branch deletion does not strand the record") {
    f.git.failDeleteBranch = true;
    auto r = f.merger.cleanup(s, o, f.persist);
    REQUIRE(r.failed.size() == 1);
    REQUIRE(r.failed[0].reason.find("Failed to delete worktree") == 0);
    REQUIRE(!f.worktrees.get(a.worktreeId));
    REQUIRE(s.reviewed.size() == 1);

    auto again = f.merger.cleanup(s, o, f.persist);
    REQUIRE(again.failed.empty());
    REQUIRE(again.merged.size() == 1);
    REQUIRE(again.merged[0].alreadyCleaned);
    REQUIRE(s.reviewed.empty());
  }
}

TEST_CASE("Merge Coordinator: Worktrees merge into their own base branch",
          "[orchestrator][merge]") {
  MergeFixture f;
  f.git.remoteExists = true;

  auto c = f.config();
  c.baseBranch = "release";
  worktree::WorktreeProvisioner releaseProvisioner{ f.worktrees, f.git, c };
  auto p = releaseProvisioner.provision(MakeTask("t1"));
  REQUIRE(p.success);
  REQUIRE(p.worktree->baseBranch == "release");

  state::ReviewedAgent a;
  a.sessionId = "sess-t1";
  a.taskId = "t1";
  a.worktreeId = p.worktree->id;
  a.branchName = p.worktree->branchName;

  state::OrchestrationState s;
  s.reviewed.push_back(a);

  MergeOptions o;
  REQUIRE(o.baseBranch == "main");
  auto r = f.merger.cleanup(s, o, f.persist);
  REQUIRE(r.merged.size() == 1);
  REQUIRE(f.git.count("fetch origin release") == 1);
  REQUIRE(f.git.count("checkout release") == 1);
  REQUIRE(f.git.count("pull origin release") == 1);
  REQUIRE(f.git.count("push origin release") == 1);
  REQUIRE(f.git.count("checkout main") == 0);
  REQUIRE(f.git.count("push origin main") == 0);
}
