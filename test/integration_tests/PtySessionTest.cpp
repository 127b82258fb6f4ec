#ifndef WIN32
#include "Pty.hpp"
#include "TestHeaders.hpp"

using namespace ox;

namespace {
const int SHELL_TIMEOUT_MS = 10000;

shared_ptr<Pty> openShell(const TerminalSize& size = TerminalSize()) {
  PtyOptions options;
  options.shell = ShellSelector::forPath("/bin/sh");
  options.size = size;
  PtyError error;
  shared_ptr<Pty> pty = Pty::open(options, &error);
  INFO(error.toString());
  REQUIRE(pty);
  REQUIRE_FALSE(error);
  return pty;
}

// Collects output until `needle` shows up or the shell goes away.
bool waitForText(Pty* pty, string* collected, const string& needle) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(SHELL_TIMEOUT_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    *collected += pty->takeOutputText();
    if (collected->find(needle) != string::npos) {
      return true;
    }
    if (!pty->isAlive()) {
      *collected += pty->takeOutputText();
      return collected->find(needle) != string::npos;
    }
    pty->waitForOutput(100);
  }
  return false;
}

bool waitForExit(Pty* pty) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(SHELL_TIMEOUT_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    if (!pty->isAlive()) {
      return true;
    }
    pty->waitForOutput(100);
    pty->clearOutput();
  }
  return false;
}
}  // namespace

// The quotes keep the echoed command line from matching the marker.

TEST_CASE("Commands reach the shell and output comes back", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  REQUIRE(pty->getBackendKind() == BackendKind::UNIX);
  REQUIRE(pty->isAlive());

  REQUIRE_FALSE(pty->runCommand("echo MARK''ER\n"));
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "MARKER"));

  pty->terminate();
}

TEST_CASE("Silent commands only leave their own output", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  REQUIRE_FALSE(pty->runCommand("echo FIR''ST\n"));
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "FIRST"));

  REQUIRE_FALSE(pty->silentRunCommand("echo SEC''OND\n"));
  collected.clear();
  REQUIRE(waitForText(pty.get(), &collected, "SECOND"));
  REQUIRE(collected.find("FIRST") == string::npos);
  pty->terminate();
}

TEST_CASE("The child sees the requested and the resized geometry",
          "[PtySession]") {
  shared_ptr<Pty> pty = openShell(TerminalSize(40, 120));
  REQUIRE_FALSE(pty->runCommand("stty size\n"));
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "40 120"));

  REQUIRE_FALSE(pty->resize(30, 100));
  REQUIRE(pty->getSize() == TerminalSize(30, 100));
  REQUIRE_FALSE(pty->runCommand("stty size\n"));
  collected.clear();
  REQUIRE(waitForText(pty.get(), &collected, "30 100"));
  pty->terminate();
}

TEST_CASE("Interrupt stops the foreground command", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  REQUIRE_FALSE(pty->runCommand("echo STAR''TED; sleep 30\n"));
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "STARTED"));
  // Give sleep a moment to become the foreground job
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  auto before = std::chrono::steady_clock::now();
  REQUIRE_FALSE(pty->signal(PtySignal::INTERRUPT));
  REQUIRE_FALSE(pty->runCommand("echo $((6*7))X\n"));
  collected.clear();
  REQUIRE(waitForText(pty.get(), &collected, "42X"));
  REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(20));
  REQUIRE(pty->isAlive());
  pty->terminate();
}

TEST_CASE("Typed characters behave like a command", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  for (char c : string("echo CH''AR\n")) {
    REQUIRE_FALSE(pty->charInput((char32_t)c));
  }
  REQUIRE(pty->pendingInput().empty());
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "CHAR"));
  pty->terminate();
}

TEST_CASE("Backspace edits the line before it is sent", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  for (char c : string("echo EDI''TX")) {
    REQUIRE_FALSE(pty->charInput((char32_t)c));
  }
  REQUIRE_FALSE(pty->charPop());
  REQUIRE(pty->pendingInput() == "echo EDI''T");
  REQUIRE_FALSE(pty->charInput('\n'));
  string collected;
  REQUIRE(waitForText(pty.get(), &collected, "EDIT\r"));
  REQUIRE(collected.find("EDITX\r") == string::npos);
  pty->terminate();
}

TEST_CASE("End of input makes the shell exit", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  REQUIRE_FALSE(pty->signal(PtySignal::END_OF_INPUT));
  REQUIRE(waitForExit(pty.get()));

  PtyError error = pty->runCommand("echo too late\n");
  REQUIRE(error);
  REQUIRE(error.getCode() == PtyErrorCode::PROCESS_EXITED);
  pty->terminate();
}

TEST_CASE("The exit status of the shell is reported", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  REQUIRE_FALSE(pty->runCommand("exit 3\n"));
  REQUIRE(waitForExit(pty.get()));

  optional<int> code;
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!code && std::chrono::steady_clock::now() < deadline) {
    code = pty->exitCode();
    if (!code) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  REQUIRE(code);
  REQUIRE(*code == 3);
}

TEST_CASE("Terminate is idempotent and closes the session", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  pty->terminate();
  REQUIRE_FALSE(pty->isAlive());
  pty->terminate();
  REQUIRE_FALSE(pty->isAlive());

  PtyError error = pty->resize(10, 10);
  REQUIRE(error);
  REQUIRE(error.getCode() == PtyErrorCode::PROCESS_EXITED);
  REQUIRE(pty->exitCode());
}

TEST_CASE("Terminate while another thread keeps writing", "[PtySession]") {
  shared_ptr<Pty> pty = openShell();
  atomic<bool> started(false);
  PtyError lastError;
  int writesBeforeClose = 0;
  std::thread writer([&]() {
    while (true) {
      PtyError error = pty->runCommand("echo x\n");
      started = true;
      if (error) {
        lastError = error;
        break;
      }
      writesBeforeClose++;
    }
  });
  while (!started) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  pty->terminate();
  writer.join();

  REQUIRE(writesBeforeClose > 0);
  REQUIRE(lastError);
  REQUIRE_FALSE(pty->isAlive());
  REQUIRE(pty->runCommand("echo y\n").getCode() ==
          PtyErrorCode::PROCESS_EXITED);
}

TEST_CASE("A missing working directory fails to open", "[PtySession]") {
  PtyOptions options;
  options.shell = ShellSelector::forPath("/bin/sh");
  options.shell.workingDirectory = "/nonexistent/oxpty/directory";
  PtyError error;
  shared_ptr<Pty> pty = Pty::open(options, &error);
  REQUIRE_FALSE(pty);
  REQUIRE(error.getCode() == PtyErrorCode::SPAWN_FAILED);
  REQUIRE(error.getOsError() == ENOENT);
}
#endif
