#include <catch2/catch.hpp>

#include <flotilla/tasks/json_task_store.hpp>
#include <flotilla/tasks/task_graph_resolver.hpp>

#include "../../test/mocks.hpp"

using namespace flot::tasks;
using flot::test::MakeTask;

namespace {
std::vector<std::string>
Ids(const std::vector<Task>& tasks) {
  std::vector<std::string> ids;
  for(auto& t : tasks)
    ids.push_back(t.id);
  return ids;
}
}

TEST_CASE("Task Graph Resolver: Unknown parent is an error",
          "[tasks][resolver]") {
  JsonTaskStore store;
  TaskGraphResolver resolver(store);

  auto r = resolver.readyDescendants("nope");
  REQUIRE(r.status == FLOT_NOT_FOUND);
  REQUIRE(r.error == "Invalid parent_task_id: nope");
  REQUIRE(r.ready.empty());
}

TEST_CASE("Task Graph Resolver: Priority and creation order",
          "[tasks][resolver]") {
  JsonTaskStore store;
  store.add(MakeTask("epic"));
  store.add(MakeTask("c", "epic", 2, TaskStatus::Open, "2024-01-03"));
  store.add(MakeTask("a", "epic", 2, TaskStatus::Open, "2024-01-01"));
  store.add(MakeTask("urgent", "epic", 0, TaskStatus::Open, "2024-01-05"));
  store.add(MakeTask("done", "epic", 1, TaskStatus::Closed));
  store.add(MakeTask("busy", "epic", 1, TaskStatus::InProgress));

  TaskGraphResolver resolver(store);
  auto r = resolver.readyDescendants("epic");
  REQUIRE(r.status == FLOT_OK);
  REQUIRE(Ids(r.ready) == std::vector<std::string>{ "urgent", "a", "c" });
}

TEST_CASE("Task Graph Resolver: Dependencies block tasks",
          "[tasks][resolver]") {
  JsonTaskStore store;
  store.add(MakeTask("epic"));
  store.add(MakeTask("schema", "epic", 1));
  store.add(MakeTask("api", "epic", 1));
  store.add(MakeTask("docs", "epic", 2));
  store.add(MakeTask("outside", "", 2, TaskStatus::Closed));
  store.addDependency({ "api", "schema", "blocks" });
  store.addDependency({ "docs", "outside", "blocks" });

  TaskGraphResolver resolver(store);

  SECTION("Open blocker holds the dependent back") {
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) == std::vector<std::string>{ "schema", "docs" });
  }

  SECTION("Closing the blocker releases the dependent") {
    REQUIRE(store.close("schema", "done", std::nullopt) == FLOT_OK);
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) == std::vector<std::string>{ "api", "docs" });
  }

  SECTION("Edges of other kinds do not block") {
    store.addDependency({ "docs", "schema", "related" });
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) == std::vector<std::string>{ "schema", "docs" });
  }

  SECTION("Unknown blocker counts as blocking") {
    store.addDependency({ "docs", "ghost", "blocks" });
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) == std::vector<std::string>{ "schema" });
  }
}

TEST_CASE("Task Graph Resolver: Blocked ancestors propagate",
          "[tasks][resolver]") {
  JsonTaskStore store;
  store.add(MakeTask("epic"));
  store.add(MakeTask("blocker", "epic", 3));
  store.add(MakeTask("feature", "epic", 1, TaskStatus::InProgress));
  store.add(MakeTask("leaf", "feature", 0));
  store.add(MakeTask("other", "epic", 2));
  store.add(MakeTask("otherleaf", "other", 1));

  TaskGraphResolver resolver(store);

  SECTION("Children of an unblocked in progress task are ready") {
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) ==
            std::vector<std::string>{ "leaf", "other", "otherleaf",
                                      "blocker" });
  }

  SECTION("Children of a blocked task are not ready") {
    store.addDependency({ "feature", "blocker", "blocks" });
    auto r = resolver.readyDescendants("epic");
    REQUIRE(Ids(r.ready) ==
            std::vector<std::string>{ "other", "otherleaf", "blocker" });
  }

  SECTION("A blocked orchestrated parent yields nothing") {
    store.addDependency({ "other", "blocker", "blocks" });
    auto r = resolver.readyDescendants("other");
    REQUIRE(r.status == FLOT_OK);
    REQUIRE(r.ready.empty());
  }
}

TEST_CASE("Task Graph Resolver: Parents come before their children",
          "[tasks][resolver]") {
  JsonTaskStore store;
  store.add(MakeTask("epic"));
  store.add(MakeTask("story", "epic", 3));
  store.add(MakeTask("mid", "story", 3, TaskStatus::Closed));
  store.add(MakeTask("subtask", "mid", 0));
  store.add(MakeTask("sibling", "epic", 1));

  TaskGraphResolver resolver(store);
  auto r = resolver.readyDescendants("epic");
  REQUIRE(Ids(r.ready) ==
          std::vector<std::string>{ "story", "subtask", "sibling" });
}
