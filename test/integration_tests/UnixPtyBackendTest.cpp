#ifndef WIN32
#include "TestHeaders.hpp"
#include "UnixPtyBackend.hpp"

using namespace ox;

namespace {
const Shell SH(ShellKind::CUSTOM, "/bin/sh");

// Polls tryRead until `needle` arrives or five seconds pass.
bool readUntil(UnixPtyBackend* backend, const string& needle, string* out) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    *out += backend->tryRead();
    if (out->find(needle) != string::npos) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}
}  // namespace

TEST_CASE("Spawning a missing executable reports the exec error",
          "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  try {
    backend.spawn(Shell(ShellKind::CUSTOM, "/nonexistent/oxpty-shell"),
                  TerminalSize(), "");
    FAIL("spawn should have thrown");
  } catch (const PtyException& ex) {
    REQUIRE(ex.getError().getCode() == PtyErrorCode::SPAWN_FAILED);
    REQUIRE(ex.getError().getOperation() == "exec");
    REQUIRE(ex.getError().getOsError() == ENOENT);
  }
  REQUIRE_FALSE(backend.isAlive());
  // Cleanup after a failed spawn is a no-op
  backend.terminate();
  backend.terminate();
}

TEST_CASE("An invalid size is rejected before forking", "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  REQUIRE_THROWS_AS(backend.spawn(SH, TerminalSize(0, 80), ""), PtyException);
  REQUIRE_FALSE(backend.isAlive());
}

TEST_CASE("A backend is single use", "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  backend.spawn(SH, TerminalSize(), "");
  REQUIRE_THROWS_AS(backend.spawn(SH, TerminalSize(), ""), PtyException);
  backend.terminate();
}

TEST_CASE("tryRead returns output without blocking", "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  backend.spawn(SH, TerminalSize(), "/");
  REQUIRE(backend.isAlive());
  REQUIRE(backend.getKind() == BackendKind::UNIX);

  auto before = std::chrono::steady_clock::now();
  backend.tryRead();
  REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(1));

  backend.write("pwd; echo DO''NE\n");
  string out;
  REQUIRE(readUntil(&backend, "DONE", &out));
  REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("/\r\n"));
  backend.terminate();
}

TEST_CASE("The child gets the terminal environment", "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  backend.spawn(SH, TerminalSize(), "");
  backend.write("echo \"T=$TERM\"\n");
  string out;
  REQUIRE(readUntil(&backend, "T=xterm-256color", &out));
  backend.terminate();
}

TEST_CASE("Exit status and terminate", "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  backend.spawn(SH, TerminalSize(), "");
  backend.write("exit 7\n");

  optional<int> code;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!code && std::chrono::steady_clock::now() < deadline) {
    backend.tryRead();
    code = backend.exitCode();
    if (!code) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  REQUIRE(code);
  REQUIRE(*code == 7);
  REQUIRE_FALSE(backend.isAlive());

  backend.terminate();
  try {
    backend.write("echo\n");
    FAIL("write should have thrown");
  } catch (const PtyException& ex) {
    REQUIRE(ex.getError().getCode() == PtyErrorCode::PROCESS_EXITED);
  }
  REQUIRE_THROWS_AS(backend.resize(TerminalSize(10, 10)), PtyException);
}

TEST_CASE("Terminate kills a shell that is still running",
          "[UnixPtyBackend]") {
  UnixPtyBackend backend;
  backend.spawn(SH, TerminalSize(), "");
  backend.terminate();
  REQUIRE_FALSE(backend.isAlive());
  optional<int> code = backend.exitCode();
  REQUIRE(code);
  REQUIRE(*code != 0);
  backend.terminate();
}
#endif
