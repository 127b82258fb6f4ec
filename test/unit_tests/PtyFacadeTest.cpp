#include "FakePtyBackend.hpp"
#include "FakeShellEnvironment.hpp"
#include "Pty.hpp"
#include "TestHeaders.hpp"

using namespace ox;

namespace {
const Shell FAKE_SHELL(ShellKind::BASH, "/bin/bash", {"--norc"});

shared_ptr<Pty> openFake(FakePtyBackend** fakeOut,
                         const PtyOptions& options = PtyOptions()) {
  FakePtyBackend* fake = new FakePtyBackend();
  *fakeOut = fake;
  PtyError error;
  shared_ptr<Pty> pty = Pty::openWithBackend(unique_ptr<PtyBackend>(fake),
                                             FAKE_SHELL, options, &error);
  REQUIRE_FALSE(error);
  REQUIRE(pty);
  return pty;
}

class PoisoningPty : public Pty {
 public:
  explicit PoisoningPty(FakePtyBackend* fake)
      : Pty(unique_ptr<PtyBackend>(fake), FAKE_SHELL, TerminalSize()) {}

  void failInsideCriticalSection() {
    SessionLock guard(this);
    outputBuffer += "kept";
    throw std::runtime_error("failure while holding the session lock");
  }

  bool isPoisoned() { return poisoned; }
};
}  // namespace

TEST_CASE("Opening spawns the shell and starts the reader", "[Pty]") {
  PtyOptions options;
  options.size = TerminalSize(30, 100);
  options.shell.workingDirectory = "/tmp";
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake, options);

  REQUIRE(fake->spawned);
  REQUIRE(fake->readerStarted);
  REQUIRE(fake->spawnedShell == FAKE_SHELL);
  REQUIRE(fake->spawnedSize == TerminalSize(30, 100));
  REQUIRE(fake->spawnedDirectory == "/tmp");
  REQUIRE(pty->isAlive());
  REQUIRE(pty->getSize() == TerminalSize(30, 100));
  REQUIRE(pty->getShell() == FAKE_SHELL);
  REQUIRE(pty->describeBackend() == "fake backend");
}

TEST_CASE("A failed spawn returns the error and cleans up", "[Pty]") {
  int terminateCalls = 0;
  FakePtyBackend* fake = new FakePtyBackend();
  fake->failSpawn = true;
  fake->externalTerminateCount = &terminateCalls;

  PtyError error;
  shared_ptr<Pty> pty = Pty::openWithBackend(unique_ptr<PtyBackend>(fake),
                                             FAKE_SHELL, PtyOptions(), &error);
  REQUIRE_FALSE(pty);
  REQUIRE(error.getCode() == PtyErrorCode::SPAWN_FAILED);
  REQUIRE(error.getOsError() == 2);
  REQUIRE(terminateCalls == 1);
}

TEST_CASE("open() reports a shell that cannot be found", "[Pty]") {
  PtyOptions options;
  options.environment.reset(new FakeShellEnvironment(false));
  PtyError error;
  REQUIRE_FALSE(Pty::open(options, &error));
  REQUIRE(error.getCode() == PtyErrorCode::SPAWN_FAILED);

  options.shell = ShellSelector::forPath("/definitely/not/a/shell");
  error = PtyError();
  REQUIRE_FALSE(Pty::open(options, &error));
  REQUIRE(error.getCode() == PtyErrorCode::SPAWN_FAILED);
  REQUIRE(error.getOperation() == "resolve");

  // A null out parameter is allowed
  REQUIRE_FALSE(Pty::open(options, NULL));
}

TEST_CASE("open() reports a failing executable check as an error", "[Pty]") {
  shared_ptr<FakeShellEnvironment> environment(new FakeShellEnvironment(true));
  environment->setVariable("PATH", "C:\\Windows\\System32");
  environment->failingChecks = true;
  PtyOptions options;
  options.environment = environment;
  PtyError error;
  shared_ptr<Pty> pty;
  REQUIRE_NOTHROW(pty = Pty::open(options, &error));
  REQUIRE_FALSE(pty);
  REQUIRE(error.getCode() == PtyErrorCode::SPAWN_FAILED);
  REQUIRE_THAT(error.getMessage(),
               Catch::Matchers::ContainsSubstring("Cannot inspect"));
}

TEST_CASE("runCommand forwards text verbatim", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->runCommand("echo one\n"));
  REQUIRE_FALSE(pty->runCommand("echo two\n"));
  REQUIRE(fake->written == "echo one\necho two\n");
  REQUIRE(fake->writes.size() == 2);
}

TEST_CASE("Typed characters match the equivalent command", "[Pty]") {
  FakePtyBackend* typedFake;
  shared_ptr<Pty> typed = openFake(&typedFake);
  const string line = "ls -la \xC3\xA9";
  const u32string characters = U"ls -la \u00E9\n";
  for (char32_t ch : characters) {
    REQUIRE_FALSE(typed->charInput(ch));
  }

  FakePtyBackend* commandFake;
  shared_ptr<Pty> command = openFake(&commandFake);
  REQUIRE_FALSE(command->runCommand(line + "\n"));

  REQUIRE(typedFake->written == commandFake->written);
  // Each keystroke went out on its own
  REQUIRE(typedFake->writes.size() == characters.size());
  REQUIRE(typed->pendingInput().empty());
}

TEST_CASE("Pending input tracks the current line", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->charInput(U'a'));
  REQUIRE_FALSE(pty->charInput(U'b'));
  REQUIRE(pty->pendingInput() == "ab");
  REQUIRE_FALSE(pty->charInput(U'\r'));
  REQUIRE(pty->pendingInput().empty());
  REQUIRE(fake->written == "ab\r");
}

TEST_CASE("charPop removes one character and sends DEL", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->charInput(U'x'));
  REQUIRE_FALSE(pty->charInput(0x20AC));
  REQUIRE(pty->pendingInput() == "x\xE2\x82\xAC");

  REQUIRE_FALSE(pty->charPop());
  REQUIRE(pty->pendingInput() == "x");
  REQUIRE_FALSE(pty->charPop());
  REQUIRE(pty->pendingInput().empty());
  REQUIRE(fake->written == "x\xE2\x82\xAC\x7f\x7f");

  // Nothing pending, nothing sent
  REQUIRE_FALSE(pty->charPop());
  REQUIRE(fake->written == "x\xE2\x82\xAC\x7f\x7f");
}

TEST_CASE("Output accumulates in arrival order", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->emitOutput("first ");
  fake->emitOutput("\x1b[1msecond\x1b[0m");
  REQUIRE(pty->output() == "first \x1b[1msecond\x1b[0m");
  // output() does not drain
  REQUIRE(pty->output() == "first \x1b[1msecond\x1b[0m");

  REQUIRE(pty->takeOutput() == "first \x1b[1msecond\x1b[0m");
  REQUIRE(pty->output().empty());

  fake->emitOutput("stale");
  pty->clearOutput();
  REQUIRE(pty->output().empty());
}

TEST_CASE("silentRunCommand drops earlier output", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->emitOutput("banner\r\n$ ");
  REQUIRE_FALSE(pty->silentRunCommand("pwd\n"));
  fake->emitOutput("/home/user\r\n");
  REQUIRE(pty->output() == "/home/user\r\n");
  REQUIRE(fake->written == "pwd\n");
}

TEST_CASE("Text views substitute malformed bytes", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->emitOutput("bad \xFF byte");
  REQUIRE(pty->outputText() == "bad \xEF\xBF\xBD byte");
  // The raw bytes are still there
  REQUIRE(pty->output() == "bad \xFF byte");
  pty->clearOutput();

  fake->emitOutput("cost: \xE2\x82");
  REQUIRE(pty->takeOutputText() == "cost: ");
  fake->emitOutput("\xAC");
  REQUIRE(pty->takeOutputText() == "\xE2\x82\xAC");
}

TEST_CASE("Clearing output also drops a split character", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->emitOutput("old \xE2\x82");
  REQUIRE(pty->takeOutputText() == "old ");

  REQUIRE_FALSE(pty->silentRunCommand("echo hi\n"));
  fake->emitOutput("hi\r\n");
  REQUIRE(pty->takeOutputText() == "hi\r\n");

  fake->emitOutput("x \xC3");
  REQUIRE(pty->takeOutputText() == "x ");
  pty->clearOutput();
  fake->emitOutput("y");
  REQUIRE(pty->takeOutputText() == "y");
}

TEST_CASE("New output notifications", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->hasNewOutput());
  fake->emitOutput("x");
  REQUIRE(pty->hasNewOutput());
  REQUIRE_FALSE(pty->hasNewOutput());

  REQUIRE_FALSE(pty->waitForOutput(10));
  std::thread producer([fake]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    fake->emitOutput("late");
  });
  REQUIRE(pty->waitForOutput(5000));
  producer.join();
  REQUIRE(pty->output() == "xlate");
}

TEST_CASE("Resize validates and forwards", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->resize(30, 100));
  REQUIRE(fake->sizes.size() == 1);
  REQUIRE(fake->sizes[0] == TerminalSize(30, 100));
  REQUIRE(pty->getSize() == TerminalSize(30, 100));

  PtyError invalid = pty->resize(0, 80);
  REQUIRE(invalid.getCode() == PtyErrorCode::RESIZE_FAILED);
  REQUIRE(fake->sizes.size() == 1);

  fake->failResize = true;
  PtyError failed = pty->resize(50, 50);
  REQUIRE(failed.getCode() == PtyErrorCode::RESIZE_FAILED);
  REQUIRE(failed.isRecoverable());
  REQUIRE(pty->getSize() == TerminalSize(30, 100));
  REQUIRE(pty->isAlive());
}

TEST_CASE("Signals are forwarded, unsupported ones are not fatal", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  REQUIRE_FALSE(pty->signal(PtySignal::INTERRUPT));
  REQUIRE(fake->signals == vector<PtySignal>{PtySignal::INTERRUPT});

  fake->unsupported.insert(PtySignal::SUSPEND);
  for (int i = 0; i < 3; i++) {
    PtyError error = pty->signal(PtySignal::SUSPEND);
    REQUIRE(error.getCode() == PtyErrorCode::SIGNAL_UNSUPPORTED);
  }
  REQUIRE(pty->isAlive());

  REQUIRE_FALSE(pty->signal(PtySignal::END_OF_INPUT));
  REQUIRE(fake->inputClosed);
}

TEST_CASE("A transient write failure leaves the session open", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->failWrite = true;
  PtyError error = pty->runCommand("lost\n");
  REQUIRE(error.getCode() == PtyErrorCode::BROKEN_PIPE);
  REQUIRE(error.isRecoverable());
  REQUIRE(pty->isAlive());

  fake->failWrite = false;
  REQUIRE_FALSE(pty->runCommand("retry\n"));
  REQUIRE(fake->written == "retry\n");
}

TEST_CASE("A child exit ends the session but keeps its output", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->emitOutput("bye\r\n");
  fake->emitExit(3);

  REQUIRE_FALSE(pty->isAlive());
  REQUIRE(pty->exitCode() == 3);
  REQUIRE(pty->takeOutput() == "bye\r\n");
  REQUIRE(pty->runCommand("ls\n").getCode() == PtyErrorCode::PROCESS_EXITED);
  REQUIRE(pty->charInput(U'a').getCode() == PtyErrorCode::PROCESS_EXITED);
  REQUIRE(pty->resize(10, 10).getCode() == PtyErrorCode::PROCESS_EXITED);
  REQUIRE(pty->signal(PtySignal::INTERRUPT).getCode() ==
          PtyErrorCode::PROCESS_EXITED);
  REQUIRE(fake->written.empty());
  // Waiting on a dead session returns at once
  REQUIRE_FALSE(pty->waitForOutput(60000));
}

TEST_CASE("Liveness follows the backend", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->killSilently();
  REQUIRE_FALSE(pty->isAlive());
  REQUIRE(pty->runCommand("x").getCode() == PtyErrorCode::PROCESS_EXITED);
}

TEST_CASE("terminate is idempotent", "[Pty]") {
  int terminateCalls = 0;
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->externalTerminateCount = &terminateCalls;

  pty->terminate();
  pty->terminate();
  REQUIRE(terminateCalls == 1);
  REQUIRE_FALSE(pty->isAlive());
  PtyError error = pty->runCommand("ls\n");
  REQUIRE(error.getCode() == PtyErrorCode::PROCESS_EXITED);
  REQUIRE(error.getMessage() == "The session is closed");

  pty.reset();
  REQUIRE(terminateCalls == 1);
}

TEST_CASE("terminate waits for a write in progress", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->blockWrites = true;

  PtyError writeError;
  std::thread writer(
      [&pty, &writeError]() { writeError = pty->runCommand("stuck\n"); });
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!fake->writeInProgress && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(fake->writeInProgress.load());

  pty->terminate();
  writer.join();
  REQUIRE(fake->writesCancelled.load());
  REQUIRE_FALSE(fake->terminatedDuringWrite);
  REQUIRE(fake->terminateCount == 1);
  REQUIRE(writeError);
  REQUIRE(writeError.getCode() == PtyErrorCode::BROKEN_PIPE);

  PtyError late = pty->runCommand("late\n");
  REQUIRE(late.getCode() == PtyErrorCode::PROCESS_EXITED);
}

TEST_CASE("Dropping the session closes it", "[Pty]") {
  int terminateCalls = 0;
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  fake->externalTerminateCount = &terminateCalls;
  pty.reset();
  REQUIRE(terminateCalls == 1);
}

TEST_CASE("Capability report describes the session", "[Pty]") {
  FakePtyBackend* fake;
  shared_ptr<Pty> pty = openFake(&fake);
  json report = pty->capabilityReport();
  REQUIRE(report["backend"] == "unix");
  REQUIRE(report["description"] == "fake backend");
  REQUIRE(report["shell"]["kind"] == "bash");
  REQUIRE(report["shell"]["executable"] == "/bin/bash");
  REQUIRE(report["size"]["rows"] == 24);
  REQUIRE(report["size"]["cols"] == 80);
  REQUIRE(report["alive"] == true);
  REQUIRE_FALSE(report.contains("exitCode"));
}

TEST_CASE("A failed critical section does not wedge the session", "[Pty]") {
  PoisoningPty pty(new FakePtyBackend());
  REQUIRE_THROWS_AS(pty.failInsideCriticalSection(), std::runtime_error);
  REQUIRE(pty.isPoisoned());
  // The lock is usable again and the state written so far survives
  REQUIRE(pty.output() == "kept");
  REQUIRE_FALSE(pty.isPoisoned());
}
