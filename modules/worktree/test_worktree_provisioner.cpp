#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>

#include <boost/filesystem/operations.hpp>

#include <flotilla/util/json_file.hpp>
#include <flotilla/worktree/json_worktree_store.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>

#include "../../test/mocks.hpp"
#include "workspace_init.hpp"

using namespace flot::worktree;
using flot::test::FakeGitOps;
using flot::test::MakeTask;
using flot::test::TempDir;

namespace fs = boost::filesystem;

namespace {
ProvisionerConfig
MakeConfig(const TempDir& root) {
  ProvisionerConfig c;
  c.project = "demo";
  c.worktreeRoot = (root.path() / "worktrees").string();
  return c;
}
}

TEST_CASE("Worktree Provisioner: Naming", "[worktree][provisioner]") {
  TempDir root;
  JsonWorktreeStore store;
  FakeGitOps git;
  WorktreeProvisioner provisioner(store, git, MakeConfig(root));

  REQUIRE(WorktreeProvisioner::BranchName("t-42") == "task/t-42");
  REQUIRE(provisioner.worktreePath("task/t-42") ==
          (root.path() / "worktrees" / "demo" / "task-t-42").string());
}

TEST_CASE("Worktree Provisioner: Provisioning", "[worktree][provisioner]") {
  TempDir root;
  TempDir repo;
  fs::create_directories(repo.path() / ".flotilla" / "hooks");
  std::ofstream((repo.path() / ".flotilla" / "hooks" / "pre-commit").string())
    << "#!/bin/sh\nexit 0\n";

  JsonWorktreeStore store;
  FakeGitOps git(repo.str());
  WorktreeProvisioner provisioner(store, git, MakeConfig(root));

  auto task = MakeTask("t1");
  auto r = provisioner.provision(task);
  REQUIRE(r.success);
  REQUIRE(!r.reused);
  REQUIRE(r.worktree);
  REQUIRE(r.worktree->branchName == "task/t1");
  REQUIRE(r.worktree->taskId == std::string("t1"));
  REQUIRE(r.worktree->status == WorktreeStatus::Active);
  REQUIRE(!r.worktree->owned());
  REQUIRE(store.get(r.worktree->id));

  const fs::path wtPath(r.worktree->path);

  SECTION("Workspace is initialized") {
    ProjectFile project;
    REQUIRE(flot::util::LoadJson(
              wtPath / ".flotilla" / "project.json", "project", project) ==
            FLOT_OK);
    REQUIRE(project.name == "demo");
    REQUIRE(project.parentProjectPath == repo.str());

    auto hook = wtPath / ".flotilla" / "hooks" / "pre-commit";
    REQUIRE(fs::exists(hook));
    REQUIRE((fs::status(hook).permissions() & fs::owner_exe) != 0);
  }

  SECTION("Owned worktrees are not provisioned twice") {
    REQUIRE(provisioner.claim(r.worktree->id, "sess-1") == FLOT_OK);
    auto again = provisioner.provision(task);
    REQUIRE(!again.success);
    REQUIRE(again.reason == "Already has active worktree: " + r.worktree->id);
    REQUIRE(git.count("worktree add") == 1);
  }

  SECTION("Unclaimed worktrees are not handed out twice") {
    auto again = provisioner.provision(task);
    REQUIRE(!again.success);
    REQUIRE(!again.reused);
    REQUIRE(again.reason == "Worktree " + r.worktree->id +
                              " is reserved for a spawn in progress");
    REQUIRE(git.count("worktree add") == 1);
    REQUIRE(store.get(r.worktree->id)->status == WorktreeStatus::Active);
    REQUIRE(!store.get(r.worktree->id)->owned());
  }

  SECTION("Released worktrees are reused") {
    REQUIRE(provisioner.claim(r.worktree->id, "sess-1") == FLOT_OK);
    REQUIRE(provisioner.release(r.worktree->id) == FLOT_OK);
    REQUIRE(store.get(r.worktree->id)->status == WorktreeStatus::Released);

    auto again = provisioner.provision(task);
    REQUIRE(again.success);
    REQUIRE(again.reused);
    REQUIRE(again.worktree->id == r.worktree->id);
    REQUIRE(store.get(r.worktree->id)->status == WorktreeStatus::Active);
    REQUIRE(git.count("worktree add") == 1);
  }

  SECTION("Destroy removes files, branch and record") {
    REQUIRE(provisioner.destroy(r.worktree->id) == FLOT_OK);
    REQUIRE(!store.get(r.worktree->id));
    REQUIRE(!fs::exists(wtPath));
    REQUIRE(git.branches.count("task/t1") == 0);
    REQUIRE(git.count("branch -D task/t1") == 1);

    // Missing worktrees are fine.
    REQUIRE(provisioner.destroy(r.worktree->id) == FLOT_OK);
  }

  SECTION("Failed git removal keeps the record") {
    git.failDelete = true;
    REQUIRE(provisioner.destroy(r.worktree->id) == FLOT_GIT_ERROR);
    REQUIRE(store.get(r.worktree->id));
    REQUIRE(git.count("branch -D") == 0);
  }

  SECTION("Failed branch deletion still removes the record") {
    git.failDeleteBranch = true;
    REQUIRE(provisioner.destroy(r.worktree->id, false, true) ==
            FLOT_GIT_ERROR);
    REQUIRE(!store.get(r.worktree->id));
    REQUIRE(!fs::exists(wtPath));
    REQUIRE(git.count("worktree remove " + r.worktree->path) == 1);
  }

  SECTION("Branches can be kept") {
    REQUIRE(provisioner.destroy(r.worktree->id, false, false) == FLOT_OK);
    REQUIRE(!store.get(r.worktree->id));
    REQUIRE(git.branches.count("task/t1") == 1);
    REQUIRE(git.count("branch -D") == 0);
  }
}

TEST_CASE("Worktree Provisioner: Rollback", "[worktree][provisioner]") {
  TempDir root;
  JsonWorktreeStore store;
  FakeGitOps git;
  WorktreeProvisioner provisioner(store, git, MakeConfig(root));

  SECTION("Git failure leaves nothing behind") {
    git.failCreate = true;
    auto r = provisioner.provision(MakeTask("t1"));
    REQUIRE(!r.success);
    REQUIRE(r.reason.find("worktree") != std::string::npos);
    REQUIRE(store.list().empty());
  }

  SECTION("Initialization failure removes worktree and record") {
    git.createAsFile = true;
    auto r = provisioner.provision(MakeTask("t1"));
    REQUIRE(!r.success);
    REQUIRE(r.reason.find("Failed to initialize worktree") == 0);
    REQUIRE(store.list().empty());
    REQUIRE(git.count("worktree remove") == 1);
    REQUIRE(git.count("branch -D task/t1") == 1);
    REQUIRE(git.branches.empty());
  }
}

TEST_CASE("Worktree Provisioner: Stale cleanup", "[worktree][provisioner]") {
  TempDir root;
  auto file = root.path() / "worktrees.json";

  auto make = [&root](std::string id, WorktreeStatus status, bool owned,
                      std::string updatedAt) {
    Worktree w;
    w.id = id;
    w.project = "demo";
    w.branchName = "task/" + id;
    w.path = (root.path() / "worktrees" / "demo" / ("task-" + id)).string();
    w.taskId = id;
    w.status = status;
    if(owned)
      w.agentSessionId = "sess-" + id;
    w.createdAt = updatedAt;
    w.updatedAt = updatedAt;
    fs::create_directories(w.path);
    return w;
  };

  const std::string old = "2020-01-01T00:00:00.000000Z";
  std::vector<Worktree> records{
    make("idle", WorktreeStatus::Active, false, old),
    make("busy", WorktreeStatus::Active, true, old),
    make("gone", WorktreeStatus::Abandoned, false, old),
    make("fresh", WorktreeStatus::Released, false, flot::util::NowIso()),
    make("merged", WorktreeStatus::Merged, false, old),
  };
  REQUIRE(flot::util::SaveJson(file, "worktrees", records) == FLOT_OK);

  JsonWorktreeStore store(file);
  REQUIRE(store.load() == FLOT_OK);
  REQUIRE(store.list().size() == 5);

  FakeGitOps git;
  WorktreeProvisioner provisioner(store, git, MakeConfig(root));

  SECTION("Dry run changes nothing") {
    auto r = provisioner.cleanupStale(std::chrono::hours(24), true);
    REQUIRE(r.dryRun);
    REQUIRE(r.candidates.size() == 2);
    REQUIRE(r.cleaned.empty());
    REQUIRE(store.get("idle")->status == WorktreeStatus::Active);
    REQUIRE(git.count("worktree remove") == 0);
  }

  SECTION("Unowned old and abandoned worktrees are destroyed") {
    auto r = provisioner.cleanupStale(std::chrono::hours(24));
    REQUIRE(r.candidates.size() == 2);
    REQUIRE(r.failed.empty());
    std::sort(r.cleaned.begin(), r.cleaned.end());
    REQUIRE(r.cleaned == std::vector<std::string>{ "gone", "idle" });

    REQUIRE(!store.get("idle"));
    REQUIRE(!store.get("gone"));
    REQUIRE(store.get("busy"));
    REQUIRE(store.get("fresh"));
    REQUIRE(store.get("merged"));
  }
}

TEST_CASE("Worktree Provisioner: Hooks from the checkout are replaced",
          "[worktree][provisioner]") {
  TempDir repo;
  TempDir checkout;
  fs::create_directories(repo.path() / ".flotilla" / "hooks");
  std::ofstream((repo.path() / ".flotilla" / "hooks" / "pre-commit").string())
    << "#!/bin/sh\nexit 0\n";

  // Tracked hooks already exist in a fresh checkout.
  const fs::path hook = checkout.path() / ".flotilla" / "hooks" / "pre-commit";
  fs::create_directories(hook.parent_path());
  std::ofstream(hook.string()) << "#!/bin/sh\nexit 1\n";

  Worktree wt;
  wt.path = checkout.str();
  std::string error;
  REQUIRE(InitializeWorkspace(wt, repo.str(), ".flotilla", "demo", error) ==
          FLOT_OK);

  std::ifstream in(hook.string());
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content == "#!/bin/sh\nexit 0\n");
  REQUIRE((fs::status(hook).permissions() & fs::owner_exe) != 0);
}
