#include <catch2/catch.hpp>

#include <thread>

#include <flotilla/orchestrator/cancellation.hpp>
#include <flotilla/tasks/json_task_store.hpp>

#include "../../test/mocks.hpp"
#include "wait_coordinator.hpp"

using namespace flot;
using namespace flot::orchestrator;
using namespace std::chrono_literals;
using flot::test::MakeTask;

TEST_CASE("Wait Coordinator: Single task", "[orchestrator][wait]") {
  tasks::JsonTaskStore store;
  store.add(MakeTask("t1"));
  WaitCoordinator waiter(store);

  SECTION("Timeout reports the current status") {
    auto r = waiter.wait("t1", 50ms, 10ms);
    REQUIRE(r.status == FLOT_OK);
    REQUIRE(r.timedOut);
    REQUIRE(!r.completed);
    REQUIRE(r.finalStatus == tasks::TaskStatus::Open);
    REQUIRE(r.waitTime >= 50ms);
  }

  SECTION("Closing from another thread ends the wait") {
    std::thread closer([&store] {
      std::this_thread::sleep_for(30ms);
      store.close("t1", "done", std::nullopt);
    });
    auto r = waiter.wait("t1", 5000ms, 5ms);
    closer.join();
    REQUIRE(r.completed);
    REQUIRE(!r.timedOut);
    REQUIRE(r.finalStatus == tasks::TaskStatus::Closed);
    REQUIRE(r.waitTime < 5000ms);
  }

  SECTION("Failed tasks count as done") {
    store.updateStatus("t1", tasks::TaskStatus::Failed);
    auto r = waiter.wait("t1", 0ms, 10ms);
    REQUIRE(r.completed);
    REQUIRE(r.finalStatus == tasks::TaskStatus::Failed);
  }

  SECTION("Cancellation") {
    Cancellation cancellation;
    std::thread canceller([&cancellation] {
      std::this_thread::sleep_for(20ms);
      cancellation.cancel();
    });
    auto r = waiter.wait("t1", 10000ms, 5000ms, &cancellation);
    canceller.join();
    REQUIRE(r.cancelled);
    REQUIRE(!r.completed);
    REQUIRE(r.waitTime < 5000ms);
  }

  SECTION("Unknown tasks and bad intervals") {
    REQUIRE(waiter.wait("nope", 10ms, 5ms).status == FLOT_NOT_FOUND);
    REQUIRE(waiter.wait("t1", 10ms, 0ms).status == FLOT_INVALID_ARGUMENT);
  }
}

TEST_CASE("Wait Coordinator: Multiple tasks", "[orchestrator][wait]") {
  tasks::JsonTaskStore store;
  store.add(MakeTask("t1"));
  store.add(MakeTask("t2"));
  store.add(MakeTask("t3", "", 2, tasks::TaskStatus::Closed));
  WaitCoordinator waiter(store);

  SECTION("Any returns the first finished task") {
    auto r = waiter.waitAny({ "t1", "t3" }, 10ms, 5ms);
    REQUIRE(r.completedTaskId == std::string("t3"));
    REQUIRE(!r.timedOut);

    auto none = waiter.waitAny({ "t1", "t2" }, 20ms, 5ms);
    REQUIRE(none.timedOut);
    REQUIRE(!none.completedTaskId);

    REQUIRE(waiter.waitAny({}, 10ms, 5ms).status == FLOT_INVALID_ARGUMENT);
  }

  SECTION("All reports completed and pending tasks") {
    auto r = waiter.waitAll({ "t1", "t2", "t3" }, 20ms, 5ms);
    REQUIRE(r.timedOut);
    REQUIRE(!r.allCompleted);
    REQUIRE(r.completed == std::vector<std::string>{ "t3" });
    REQUIRE(r.pending == std::vector<std::string>{ "t1", "t2" });

    store.close("t1", "done", std::nullopt);
    store.close("t2", "done", std::nullopt);
    auto done = waiter.waitAll({ "t1", "t2", "t3" }, 20ms, 5ms);
    REQUIRE(done.allCompleted);
    REQUIRE(done.pending.empty());
  }

  SECTION("All with an unknown task") {
    auto r = waiter.waitAll({ "t1", "ghost" }, 20ms, 5ms);
    REQUIRE(r.status == FLOT_NOT_FOUND);
    REQUIRE(r.error.find("ghost") != std::string::npos);
  }
}
