#include <catch2/catch.hpp>

#include <flotilla/tasks/json_task_store.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/json_worktree_store.hpp>
#include <flotilla/worktree/worktree_provisioner.hpp>

#include "../../test/mocks.hpp"
#include "review_router.hpp"

using namespace flot;
using namespace flot::orchestrator;
using flot::test::FakeGitOps;
using flot::test::MakeTask;
using flot::test::TempDir;

namespace {
struct ReviewFixture {
  TempDir root;
  tasks::JsonTaskStore tasks;
  worktree::JsonWorktreeStore worktrees;
  FakeGitOps git;
  worktree::WorktreeProvisioner provisioner{ worktrees, git, config() };
  ReviewRouter router{ tasks, provisioner };

  worktree::ProvisionerConfig config() const {
    worktree::ProvisionerConfig c;
    c.project = "demo";
    c.worktreeRoot = (root.path() / "worktrees").string();
    return c;
  }

  state::SpawnedAgent agent(const std::string& taskId,
                            tasks::TaskStatus status) {
    tasks.add(MakeTask(taskId, "epic", 2, status));
    auto r = provisioner.provision(*tasks.get(taskId));
    REQUIRE(r.success);
    state::SpawnedAgent a;
    a.sessionId = "sess-" + taskId;
    a.taskId = taskId;
    a.worktreeId = r.worktree->id;
    a.branchName = r.worktree->branchName;
    REQUIRE(provisioner.claim(a.worktreeId, a.sessionId) == FLOT_OK);
    return a;
  }

  state::CompletedAgent completed(const std::string& taskId) {
    state::CompletedAgent c;
    c.agent = agent(taskId, tasks::TaskStatus::Closed);
    c.completedAt = util::NowIso();
    return c;
  }

  state::FailedAgent failed(const std::string& taskId,
                            tasks::TaskStatus status,
                            std::string reason) {
    state::FailedAgent f;
    f.agent = agent(taskId, status);
    f.reason = std::move(reason);
    return f;
  }
};
}

TEST_CASE("Review Router: Completed work", "[orchestrator][review]") {
  ReviewFixture f;
  state::OrchestrationState s;
  s.completed = { f.completed("t1"), f.completed("t2") };

  SECTION("Without validation everything is reviewed") {
    auto r = f.router.route(s, ReviewOptions{});
    REQUIRE(r.reviewed.size() == 2);
    REQUIRE(s.reviewed.size() == 2);
    REQUIRE(s.completed.empty());
    REQUIRE(s.reviewed[0].branchName == "task/t1");
  }

  SECTION("With validation") {
    ReviewOptions o;
    o.requireValidation = true;
    o.maxValidationRetries = 2;

    REQUIRE(f.tasks.setValidation("t1", tasks::ValidationStatus::Valid, 0) ==
            FLOT_OK);

    SECTION("Pending validation keeps the record") {
      auto r = f.router.route(s, o);
      REQUIRE(r.reviewed.size() == 1);
      REQUIRE(r.reviewed[0].taskId == "t1");
      REQUIRE(r.awaitingValidation == std::vector<std::string>{ "t2" });
      REQUIRE(s.completed.size() == 1);
      REQUIRE(s.completed[0].agent.taskId == "t2");
    }

    SECTION("Invalid work is retried") {
      f.tasks.setValidation("t2", tasks::ValidationStatus::Invalid, 1);
      auto worktreeId = s.completed[1].agent.worktreeId;
      auto r = f.router.route(s, o);
      REQUIRE(r.retried.size() == 1);
      REQUIRE(r.retried[0].taskId == "t2");
      REQUIRE(r.retried[0].reason == "Validation failed");
      REQUIRE(s.completed.empty());
      REQUIRE(f.tasks.get("t2")->status == tasks::TaskStatus::Open);
      REQUIRE(!f.worktrees.get(worktreeId)->owned());
    }

    SECTION("Invalid work escalates after too many attempts") {
      f.tasks.setValidation("t2", tasks::ValidationStatus::Invalid, 2);
      auto r = f.router.route(s, o);
      REQUIRE(r.escalated.size() == 1);
      REQUIRE(r.escalated[0].agent.taskId == "t2");
      REQUIRE(s.escalated.size() == 1);
      REQUIRE(s.completed.empty());
      REQUIRE(f.tasks.get("t2")->status == tasks::TaskStatus::Closed);
    }
  }
}

TEST_CASE("Review Router: Failed workers", "[orchestrator][review]") {
  ReviewFixture f;
  state::OrchestrationState s;
  s.failed = {
    f.failed("crashed",
             tasks::TaskStatus::InProgress,
             "Agent exited without completing task"),
    f.failed("unstarted",
             tasks::TaskStatus::Open,
             "Agent exited before starting work"),
    f.failed(
      "broken", tasks::TaskStatus::Failed, "Agent exited and task was marked failed"),
    f.failed("odd", tasks::TaskStatus::InProgress, "Status check failed: x"),
  };
  const auto crashedWorktree = s.failed[0].agent.worktreeId;

  auto r = f.router.route(s, ReviewOptions{});

  REQUIRE(s.failed.empty());
  REQUIRE(r.retried.size() == 2);
  REQUIRE(r.retried[0].taskId == "crashed");
  REQUIRE(r.retried[1].taskId == "unstarted");
  REQUIRE(f.tasks.get("crashed")->status == tasks::TaskStatus::Open);
  REQUIRE(!f.worktrees.get(crashedWorktree)->owned());

  REQUIRE(r.escalated.size() == 2);
  REQUIRE(s.escalated.size() == 2);
  REQUIRE(r.escalated[0].agent.taskId == "broken");
  REQUIRE(r.escalated[1].agent.taskId == "odd");
  REQUIRE(f.tasks.get("broken")->status == tasks::TaskStatus::Failed);
}
