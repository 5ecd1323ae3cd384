#include "FakeRemoteClient.hpp"
#include "RecordingEventSink.hpp"
#include "RemoteSessionController.hpp"
#include "TestHeaders.hpp"

using namespace gm;

namespace {
const string CLIENT = "client-1";

bool connectedOk(const json& payload) {
  return payload.is_object() && payload.value("ok", false);
}

class RemoteFixture {
 public:
  RemoteFixture()
      : sink(new RecordingEventSink()),
        factory(new FakeRemoteClientFactory()),
        controller(new RemoteSessionController(sink, factory)) {}

  ~RemoteFixture() { controller->shutdown(); }

  shared_ptr<FakeRemoteClient> connectNow() {
    int index = factory->numCreated();
    controller->connect(CLIENT, "example.com", "alice", nullopt, "");
    REQUIRE(sink->waitFor(CLIENT, "ssh_connection_event", connectedOk));
    REQUIRE(controller->hasSession(CLIENT));
    sink->clear();
    return factory->client(index);
  }

  shared_ptr<FakeRemoteChannel> startCommand(shared_ptr<FakeRemoteClient> client,
                                             const string& command,
                                             int index = 0) {
    controller->runCommand(CLIENT, command);
    REQUIRE(sink->waitFor(CLIENT, "ssh_output", stateIs("started")));
    auto channel = client->commandChannel(index);
    REQUIRE(channel.get() != NULL);
    return channel;
  }

  shared_ptr<RecordingEventSink> sink;
  shared_ptr<FakeRemoteClientFactory> factory;
  shared_ptr<RemoteSessionController> controller;
};
}  // namespace

TEST_CASE("Remote access can be unavailable", "[RemoteSessionController]") {
  auto sink = make_shared<RecordingEventSink>();
  SECTION("No transport") {
    RemoteSessionController controller(sink,
                                       shared_ptr<RemoteClientFactory>());
    REQUIRE_FALSE(controller.isAvailable());
    controller.connect(CLIENT, "example.com", "alice", nullopt, "22");
    controller.runCommand(CLIENT, "ls");
    controller.startShell(CLIENT);
  }
  SECTION("Disabled by configuration") {
    RemoteSessionController controller(
        sink, make_shared<FakeRemoteClientFactory>(), false);
    REQUIRE_FALSE(controller.isAvailable());
    controller.connect(CLIENT, "example.com", "alice", nullopt, "22");
    controller.runCommand(CLIENT, "ls");
    controller.startShell(CLIENT);
  }
  const string unsupported =
      "Remote shell support is not available on this server.";
  REQUIRE(sink->count(CLIENT, "ssh_connection_event", messageIs(unsupported)) ==
          1);
  REQUIRE(sink->count(CLIENT, "ssh_output", messageIs(unsupported)) == 1);
  REQUIRE(sink->count(CLIENT, "ssh_shell_event", messageIs(unsupported)) == 1);
}

TEST_CASE("Connect validates its input", "[RemoteSessionController]") {
  RemoteFixture f;
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "ssh");
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "70000");
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "0");
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event",
                        messageIs("Invalid port number.")) == 3);

  f.controller->connect(CLIENT, "   ", "alice", nullopt, "22");
  f.controller->connect(CLIENT, "example.com", "", nullopt, "22");
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event",
                        messageIs("Host and username are required to "
                                  "connect.")) == 2);

  REQUIRE(f.factory->numCreated() == 0);
  REQUIRE_FALSE(f.controller->hasPendingConnection(CLIENT));
}

TEST_CASE("Connect succeeds with trimmed input and the default port",
          "[RemoteSessionController]") {
  RemoteFixture f;
  f.controller->connect(CLIENT, " example.com ", " alice ", string("secret"),
                        " ");
  REQUIRE(f.sink->waitFor(CLIENT, "ssh_connection_event",
                          messageIs("Connected to alice@example.com:22")));
  REQUIRE(f.controller->hasSession(CLIENT));
  REQUIRE(waitUntil(
      [&]() { return !f.controller->hasPendingConnection(CLIENT); }));

  RemoteTarget target = f.factory->client(0)->getTarget();
  REQUIRE(target.host == "example.com");
  REQUIRE(target.username == "alice");
  REQUIRE(target.port == 22);
  REQUIRE(target.password == optional<string>("secret"));
  REQUIRE(target.timeoutSeconds == DEFAULT_REMOTE_TIMEOUT);
}

TEST_CASE("Connect failures are reported", "[RemoteSessionController]") {
  RemoteFixture f;
  f.factory->defaultBehavior.failure = string("Authentication failed");
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "2222");
  REQUIRE(f.sink->waitFor(
      CLIENT, "ssh_connection_event",
      messageIs("Connection failed: Authentication failed")));
  REQUIRE_FALSE(f.controller->hasSession(CLIENT));
  REQUIRE(waitUntil(
      [&]() { return !f.controller->hasPendingConnection(CLIENT); }));
  REQUIRE(f.factory->client(0)->closed);
}

TEST_CASE("Disconnect while connecting sends one cancellation",
          "[RemoteSessionController]") {
  RemoteFixture f;
  f.factory->defaultBehavior.block = true;
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "22");
  auto client = f.factory->client(0);
  REQUIRE(waitUntil([&]() { return bool(client->connecting); }));
  REQUIRE(f.controller->hasPendingConnection(CLIENT));

  f.controller->disconnect(CLIENT);
  REQUIRE_FALSE(f.controller->hasPendingConnection(CLIENT));
  REQUIRE(client->closed);
  REQUIRE(waitUntil([&]() { return bool(client->connectFinished); }));
  // Let the worker finish its bookkeeping
  this_thread::sleep_for(chrono::milliseconds(100));

  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event",
                        messageIs("Connection request cancelled.")) == 1);
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event") == 1);
  REQUIRE_FALSE(f.controller->hasSession(CLIENT));
}

TEST_CASE("A connect that completes after cancellation is discarded",
          "[RemoteSessionController]") {
  RemoteFixture f;
  f.factory->defaultBehavior.block = true;
  f.factory->defaultBehavior.succeedAfterClose = true;
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "22");
  auto client = f.factory->client(0);
  REQUIRE(waitUntil([&]() { return bool(client->connecting); }));

  f.controller->disconnect(CLIENT);
  REQUIRE(waitUntil([&]() { return bool(client->connectFinished); }));
  this_thread::sleep_for(chrono::milliseconds(100));

  REQUIRE_FALSE(f.controller->hasSession(CLIENT));
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event") == 1);
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event",
                        messageIs("Connection request cancelled.")) == 1);

  // Nothing is left to run commands on
  const string noConnection = "No SSH connection established.";
  f.controller->runCommand(CLIENT, "ls");
  REQUIRE(f.sink->count(CLIENT, "ssh_output") == 1);
  REQUIRE(f.sink->count(CLIENT, "ssh_output", [&](const json& payload) {
    return payload.value("ok", true) == false &&
           messageIs(noConnection)(payload);
  }) == 1);
  f.controller->startShell(CLIENT);
  f.controller->shellInput(CLIENT, "ls\n");
  REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                        messageIs(noConnection)) == 2);
  REQUIRE(client->commandChannel(0).get() == NULL);
  REQUIRE(client->shellChannel(0).get() == NULL);
}

TEST_CASE("A newer connect keeps its pending record",
          "[RemoteSessionController]") {
  RemoteFixture f;
  FakeConnectBehavior blocking;
  blocking.block = true;
  f.factory->queueBehavior(blocking);
  f.factory->queueBehavior(blocking);

  f.controller->connect(CLIENT, "first.example.com", "alice", nullopt, "22");
  auto first = f.factory->client(0);
  REQUIRE(waitUntil([&]() { return bool(first->connecting); }));

  f.controller->connect(CLIENT, "second.example.com", "alice", nullopt, "22");
  auto second = f.factory->client(1);
  REQUIRE(waitUntil([&]() { return bool(second->connecting); }));

  // The first attempt was closed by the second and has failed by now
  REQUIRE(first->closed);
  REQUIRE(waitUntil([&]() { return bool(first->connectFinished); }));
  this_thread::sleep_for(chrono::milliseconds(100));
  REQUIRE(f.controller->hasPendingConnection(CLIENT));
  // Superseded attempts are silent
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event") == 0);

  second->release();
  REQUIRE(f.sink->waitFor(
      CLIENT, "ssh_connection_event",
      messageIs("Connected to alice@second.example.com:22")));
  REQUIRE(waitUntil(
      [&]() { return !f.controller->hasPendingConnection(CLIENT); }));
  REQUIRE(f.controller->hasSession(CLIENT));
  REQUIRE(f.sink->count(CLIENT, "ssh_connection_event") == 1);
}

TEST_CASE("Reconnecting replaces the existing session silently",
          "[RemoteSessionController]") {
  RemoteFixture f;
  auto first = f.connectNow();
  f.controller->connect(CLIENT, "example.com", "alice", nullopt, "22");
  REQUIRE(f.sink->waitFor(CLIENT, "ssh_connection_event", connectedOk));
  REQUIRE(first->closed);
  REQUIRE(f.sink->count(CLIENT, "ssh_disconnected") == 0);
}

TEST_CASE("Commands stream output and finish", "[RemoteSessionController]") {
  RemoteFixture f;
  auto client = f.connectNow();

  SECTION("Without a command") {
    f.controller->runCommand(CLIENT, "   ");
    REQUIRE(f.sink->count(CLIENT, "ssh_output",
                          messageIs("No command provided.")) == 1);
  }

  SECTION("Successful command") {
    auto channel = f.startCommand(client, "ls -l");
    channel->pushStdout("file1\r\nfile2\r\n");
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", [](const json& p) {
      return p.value("state", "") == "stream" && p.contains("output") &&
             p["output"] == "file1\nfile2\n" && p["ok"] == true &&
             p["command"] == "ls -l";
    }));
    channel->pushStderr("\x1b[31mwarning\x1b[0m");
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", [](const json& p) {
      return p.value("state", "") == "stream" && p.contains("error_output") &&
             p["error_output"] == "warning" && p["ok"] == false;
    }));
    channel->finish(0);
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
    auto finished = f.sink->events(CLIENT, "ssh_output").back().payload;
    REQUIRE(finished["ok"] == true);
    REQUIRE(finished["exit_status"] == 0);
    REQUIRE(finished["message"] == "Command completed.");
    REQUIRE(channel->closed);

    // The slot is free as soon as the finished event is out
    f.sink->clear();
    f.startCommand(client, "pwd", 1);
    REQUIRE(f.sink->count(CLIENT, "ssh_output",
                          messageIs("A previous command is still running. Try "
                                    "again when it finishes.")) == 0);
  }

  SECTION("Failing command") {
    auto channel = f.startCommand(client, "false");
    channel->finish(3);
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
    auto finished = f.sink->events(CLIENT, "ssh_output").back().payload;
    REQUIRE(finished["ok"] == false);
    REQUIRE(finished["exit_status"] == 3);
    REQUIRE(finished["message"] == "Command completed with exit status 3.");
  }

  SECTION("Spawn failure") {
    client->failExec = true;
    f.controller->runCommand(CLIENT, "ls");
    REQUIRE(f.sink->count(CLIENT, "ssh_output",
                          messageIs("Failed to run command: exec refused")) ==
            1);
    REQUIRE(f.sink->count(CLIENT, "ssh_output", stateIs("started")) == 0);
  }

  SECTION("Read failure") {
    auto channel = f.startCommand(client, "cat");
    channel->failReads = true;
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
    auto finished = f.sink->events(CLIENT, "ssh_output").back().payload;
    REQUIRE(finished["ok"] == false);
    REQUIRE(finished["message"] ==
            "Unexpected error while running the command.");
  }
}

TEST_CASE("Only one command runs at a time", "[RemoteSessionController]") {
  RemoteFixture f;
  auto client = f.connectNow();
  auto channel = f.startCommand(client, "sleep 100");

  f.controller->runCommand(CLIENT, "ls");
  REQUIRE(f.sink->count(CLIENT, "ssh_output",
                        messageIs("A previous command is still running. Try "
                                  "again when it finishes.")) == 1);
  REQUIRE_FALSE(channel->closed);
  REQUIRE(client->commandChannel(1).get() == NULL);

  channel->finish(0);
  REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
}

TEST_CASE("Command input", "[RemoteSessionController]") {
  RemoteFixture f;

  SECTION("Without a session") {
    f.controller->sendCommandInput(CLIENT, "y\n");
    REQUIRE(f.sink->count(CLIENT, "ssh_output", stateIs("input_error")) == 1);
  }

  SECTION("Without a command") {
    f.connectNow();
    f.controller->sendCommandInput(CLIENT, "y\n");
    REQUIRE(f.sink->count(CLIENT, "ssh_output",
                          messageIs("No command is currently running.")) == 1);
  }

  SECTION("Written to the running command") {
    auto client = f.connectNow();
    auto channel = f.startCommand(client, "cat");
    f.controller->sendCommandInput(CLIENT, "hello\n");
    REQUIRE(channel->getWritten() == "hello\n");
    channel->finish(0);
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
  }

  SECTION("A failed write terminates the command") {
    auto client = f.connectNow();
    auto channel = f.startCommand(client, "cat");
    channel->failWrites = true;
    f.controller->sendCommandInput(CLIENT, "hello\n");
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
    auto finished = f.sink->events(CLIENT, "ssh_output").back().payload;
    REQUIRE(finished["ok"] == false);
    REQUIRE(finished["message"] ==
            "Failed to send input to the command; it has been terminated.");
    REQUIRE(channel->closed);
  }
}

TEST_CASE("Interactive shell lifecycle", "[RemoteSessionController]") {
  RemoteFixture f;

  SECTION("Input before start") {
    f.connectNow();
    f.controller->shellInput(CLIENT, "ls\n");
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell has not been "
                                    "started.")) == 1);
  }

  SECTION("Start, use and stop") {
    auto client = f.connectNow();
    f.controller->startShell(CLIENT);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell started.")) == 1);
    f.controller->startShell(CLIENT);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell is already active.")) ==
            1);
    auto channel = client->shellChannel(0);
    REQUIRE(client->shellChannel(1).get() == NULL);

    f.controller->shellInput(CLIENT, "ls\n");
    REQUIRE(channel->getWritten() == "ls\n");

    channel->pushStdout("\x1b]0;alice@host\x07$ ");
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_shell_output", [](const json& p) {
      return p["output"] == "$ " && p["isError"] == false;
    }));
    channel->pushStderr("bash: nope\r\n");
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_shell_output", [](const json& p) {
      return p["output"] == "bash: nope\n" && p["isError"] == true;
    }));

    f.controller->stopShell(CLIENT);
    f.controller->stopShell(CLIENT);
    this_thread::sleep_for(chrono::milliseconds(150));
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell stopped.")) == 1);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell session ended.")) == 0);
    REQUIRE(channel->closed);
  }

  SECTION("The remote end closes the shell") {
    auto client = f.connectNow();
    f.controller->startShell(CLIENT);
    auto channel = client->shellChannel(0);
    channel->closed = true;
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_shell_event",
                            messageIs("Interactive shell session ended.")));
    f.controller->stopShell(CLIENT);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell stopped.")) == 0);
  }

  SECTION("A failed write closes the shell") {
    auto client = f.connectNow();
    f.controller->startShell(CLIENT);
    auto channel = client->shellChannel(0);
    channel->failWrites = true;
    f.controller->shellInput(CLIENT, "ls\n");
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Failed to send data to the interactive "
                                    "shell; it has been closed.")) == 1);
    REQUIRE(channel->closed);
  }

  SECTION("Open failure") {
    auto client = f.connectNow();
    client->failShell = true;
    f.controller->startShell(CLIENT);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Failed to start interactive shell: shell "
                                    "refused")) == 1);
  }
}

TEST_CASE("A command and a shell run side by side",
          "[RemoteSessionController]") {
  RemoteFixture f;
  auto client = f.connectNow();
  auto command = f.startCommand(client, "tail -f log");
  f.controller->startShell(CLIENT);
  REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                        messageIs("Interactive shell started.")) == 1);
  command->pushStdout("line\n");
  client->shellChannel(0)->pushStdout("$ ");
  REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("stream")));
  REQUIRE(f.sink->waitFor(CLIENT, "ssh_shell_output"));
}

TEST_CASE("Disconnect tears the session down", "[RemoteSessionController]") {
  RemoteFixture f;

  SECTION("Without a session nothing is sent") {
    f.controller->disconnect(CLIENT);
    REQUIRE(f.sink->events().empty());
  }

  SECTION("Running command and shell are stopped") {
    auto client = f.connectNow();
    auto command = f.startCommand(client, "sleep 100");
    f.controller->startShell(CLIENT);
    auto shell = client->shellChannel(0);

    f.controller->disconnect(CLIENT);
    REQUIRE(f.sink->waitFor(CLIENT, "ssh_output", stateIs("finished")));
    this_thread::sleep_for(chrono::milliseconds(150));

    REQUIRE_FALSE(f.controller->hasSession(CLIENT));
    REQUIRE(client->closed);
    REQUIRE(command->closed);
    REQUIRE(shell->closed);

    auto finished = f.sink->events(CLIENT, "ssh_output").back().payload;
    REQUIRE(finished["ok"] == false);
    REQUIRE(finished["message"] ==
            "Command terminated because the connection was closed.");
    REQUIRE(f.sink->count(CLIENT, "ssh_output", stateIs("finished")) == 1);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell stopped.")) == 1);
    REQUIRE(f.sink->count(CLIENT, "ssh_shell_event",
                          messageIs("Interactive shell session ended.")) == 0);
    REQUIRE(f.sink->count(CLIENT, "ssh_disconnected",
                          messageIs("SSH connection closed.")) == 1);
  }
}

TEST_CASE("A dropped client is cleaned up without messages",
          "[RemoteSessionController]") {
  RemoteFixture f;
  auto client = f.connectNow();
  f.controller->startShell(CLIENT);
  f.sink->clear();

  f.controller->clientDisconnected(CLIENT);
  this_thread::sleep_for(chrono::milliseconds(150));
  REQUIRE_FALSE(f.controller->hasSession(CLIENT));
  REQUIRE(client->closed);
  REQUIRE(f.sink->events().empty());
}
