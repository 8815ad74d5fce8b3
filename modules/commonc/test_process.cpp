#include <catch2/catch.hpp>

#include <thread>

#include <flotilla/util/process.hpp>

#include "../../test/mocks.hpp"

using namespace flot::util;
using flot::test::TempDir;

TEST_CASE("Process: Running commands", "[commonc][process]") {
  SECTION("Output and exit code are captured") {
    auto r = RunProcess({ "sh", "-c", "echo out; echo err >&2; exit 3" });
    REQUIRE(r.started);
    REQUIRE(!r.timedOut);
    REQUIRE(r.exitCode == 3);
    REQUIRE(r.out == "out\n");
    REQUIRE(r.err == "err\n");
    REQUIRE(!r.ok());
  }

  SECTION("Working directory") {
    TempDir dir;
    ProcessOptions o;
    o.cwd = dir.str();
    auto r = RunProcess({ "pwd" }, o);
    REQUIRE(r.ok());
    REQUIRE(r.out.find(dir.path().filename().string()) != std::string::npos);
  }

  SECTION("Timeouts kill the child") {
    ProcessOptions o;
    o.timeout = std::chrono::milliseconds(100);
    auto r = RunProcess({ "sleep", "10" }, o);
    REQUIRE(r.started);
    REQUIRE(r.timedOut);
    REQUIRE(!r.ok());
  }

  SECTION("Missing executables") {
    auto r = RunProcess({ "flotilla-this-command-does-not-exist" });
    REQUIRE(!r.ok());
  }
}

TEST_CASE("Process: Detached children", "[commonc][process]") {
  std::string error;
  pid_t pid = SpawnDetached({ "sleep", "0.1" }, "", "", error);
  REQUIRE(pid > 0);
  REQUIRE(error.empty());

  auto deadline =
    std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while(IsProcessAlive(pid) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  REQUIRE(!IsProcessAlive(pid));
}
