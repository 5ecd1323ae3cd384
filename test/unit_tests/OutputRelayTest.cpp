#include "FakeDebugSession.hpp"
#include "OutputRelay.hpp"
#include "RecordingEventSink.hpp"
#include "TestHeaders.hpp"

using namespace gm;

namespace {
class RelayFixture {
 public:
  RelayFixture()
      : sink(new RecordingEventSink()),
        factory(new FakeDebugSessionFactory()),
        manager(new SessionManager(factory)),
        relay(new OutputRelay(manager, sink, 10)) {}

  shared_ptr<RecordingEventSink> sink;
  shared_ptr<FakeDebugSessionFactory> factory;
  shared_ptr<SessionManager> manager;
  shared_ptr<OutputRelay> relay;
};

bool isFatalNotice(const json& payload) {
  return payload.is_array() && payload.size() == 1 &&
         payload[0]["type"] == "console" && payload[0]["stream"] == "stderr" &&
         payload[0]["message"].is_null() &&
         payload[0]["payload"] == OutputRelay::GDB_KILLED_MESSAGE;
}
}  // namespace

TEST_CASE("Responses and pty output reach every subscriber", "[OutputRelay]") {
  RelayFixture f;
  auto session = f.manager->addNewDebugSession("gdb", "mi2", "a");
  f.manager->connectClientToDebugSession(session->getPid(), "b");
  f.manager->addNewDebugSession("gdb", "mi2", "c");
  auto fake = f.factory->session(0);

  json records = json::array();
  records.push_back({{"type", "result"},
                     {"message", "done"},
                     {"payload", nullptr},
                     {"token", nullptr},
                     {"stream", "stdout"}});
  fake->queueResponse(records);
  fake->queuePtyOutput(PtyKind::USER, "(gdb) ");
  fake->queuePtyOutput(PtyKind::PROGRAM, "hello from the program\n");

  f.relay->tick();

  for (const string& client : {"a", "b"}) {
    REQUIRE(f.sink->count(client, "gdb_response") == 1);
    REQUIRE(f.sink->events(client, "gdb_response")[0].payload == records);
    REQUIRE(f.sink->events(client, "user_pty_response")[0].payload ==
            "(gdb) ");
    REQUIRE(f.sink->events(client, "program_pty_response")[0].payload ==
            "hello from the program\n");
  }
  REQUIRE(f.sink->events("c", "gdb_response").empty());
  REQUIRE(f.sink->events("c", "user_pty_response").empty());

  // The controller broadcast precedes the pty broadcasts
  auto events = f.sink->events();
  vector<string> names;
  for (auto& e : events) {
    if (e.room == "a") {
      names.push_back(e.name);
    }
  }
  REQUIRE(names == vector<string>({"gdb_response", "user_pty_response",
                                   "program_pty_response"}));

  f.sink->clear();
  f.relay->tick();
  REQUIRE(f.sink->events().empty());
}

TEST_CASE("A session whose gdb dies is removed after one fatal notice",
          "[OutputRelay]") {
  RelayFixture f;
  auto healthy = f.manager->addNewDebugSession("gdb", "mi2", "a");
  auto doomed = f.manager->addNewDebugSession("gdb", "mi2", "k");
  f.manager->connectClientToDebugSession(doomed->getPid(), "k2");
  auto fake = f.factory->session(1);
  fake->failPollOnCall = 3;
  fake->queuePtyOutput(PtyKind::USER, "never sent");

  f.relay->tick();
  f.relay->tick();
  REQUIRE(f.manager->numSessions() == 2);
  // Pty output of the first two ticks was delivered
  REQUIRE(f.sink->count("k", "user_pty_response") == 1);

  f.factory->session(0)->queuePtyOutput(PtyKind::USER, "still alive");
  fake->queuePtyOutput(PtyKind::USER, "lost");
  f.relay->tick();

  for (const string& client : {"k", "k2"}) {
    REQUIRE(f.sink->count(client, "gdb_response", isFatalNotice) == 1);
    REQUIRE(f.sink->count(client, "fatal_server_error") == 0);
    // Only the first tick's output, the dead session skips its pty reads
    REQUIRE(f.sink->count(client, "user_pty_response") == 1);
  }
  REQUIRE(f.manager->numSessions() == 1);
  REQUIRE(f.manager->debugSessionFromClientId("a") == healthy);
  REQUIRE(fake->terminateCount == 1);
  REQUIRE(f.sink->count("a", "user_pty_response") == 1);
  REQUIRE(f.sink->count("a", "gdb_response") == 0);

  f.sink->clear();
  f.relay->tick();
  REQUIRE(f.sink->count("k", "gdb_response") == 0);
  REQUIRE(fake->terminateCount == 1);
}

TEST_CASE("A pty failure sends fatal_server_error and removes the session",
          "[OutputRelay]") {
  RelayFixture f;
  f.manager->addNewDebugSession("gdb", "mi2", "a");
  auto fake = f.factory->session(0);
  fake->failPtyRead = true;

  f.relay->tick();
  REQUIRE(f.sink->count("a", "fatal_server_error",
                        messageIs("pty read failed")) == 1);
  REQUIRE(f.manager->numSessions() == 0);
  REQUIRE(fake->terminateCount == 1);
}

TEST_CASE("The relay thread starts once and stops", "[OutputRelay]") {
  RelayFixture f;
  REQUIRE_FALSE(f.relay->isRunning());
  f.manager->addNewDebugSession("gdb", "mi2", "a");
  f.relay->startIfNeeded();
  f.relay->startIfNeeded();
  REQUIRE(f.relay->isRunning());

  f.factory->session(0)->queuePtyOutput(PtyKind::PROGRAM, "tick\n");
  REQUIRE(f.sink->waitFor("a", "program_pty_response"));

  f.relay->stop();
  REQUIRE_FALSE(f.relay->isRunning());
  f.factory->session(0)->queuePtyOutput(PtyKind::PROGRAM, "late\n");
  this_thread::sleep_for(chrono::milliseconds(50));
  REQUIRE(f.sink->count("a", "program_pty_response") == 1);
}
