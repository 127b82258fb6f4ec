#include "BackendSelector.hpp"
#include "TestHeaders.hpp"

using namespace ox;

TEST_CASE("Unix hosts always get the unix backend", "[BackendSelector]") {
  REQUIRE(BackendSelector::choose(false, false, false) == BackendKind::UNIX);
  REQUIRE(BackendSelector::choose(false, true, true) == BackendKind::UNIX);
}

TEST_CASE("Windows prefers ConPTY and falls back to winpty",
          "[BackendSelector]") {
  REQUIRE(BackendSelector::choose(true, true, true) == BackendKind::CONPTY);
  REQUIRE(BackendSelector::choose(true, true, false) == BackendKind::CONPTY);
  REQUIRE(BackendSelector::choose(true, false, true) == BackendKind::WINPTY);
}

TEST_CASE("Windows without ConPTY or fallback is NotAvailable",
          "[BackendSelector]") {
  try {
    BackendSelector::choose(true, false, false);
    FAIL("choose() should have thrown");
  } catch (const PtyException& ex) {
    REQUIRE(ex.getError().getCode() == PtyErrorCode::NOT_AVAILABLE);
  }
}

TEST_CASE("Backends that are not built cannot be created",
          "[BackendSelector]") {
#ifdef WIN32
  REQUIRE_THROWS_AS(BackendSelector::create(BackendKind::UNIX), PtyException);
  REQUIRE(BackendSelector::create(BackendKind::CONPTY)->getKind() ==
          BackendKind::CONPTY);
#else
  REQUIRE_THROWS_AS(BackendSelector::create(BackendKind::CONPTY), PtyException);
  REQUIRE_THROWS_AS(BackendSelector::create(BackendKind::WINPTY), PtyException);
  unique_ptr<PtyBackend> backend = BackendSelector::create(BackendKind::UNIX);
  REQUIRE(backend->getKind() == BackendKind::UNIX);
  REQUIRE_FALSE(backend->isAlive());
  // Terminating a backend that never spawned is harmless
  backend->terminate();
  backend->terminate();
#endif
}

TEST_CASE("ConPTY probe", "[BackendSelector]") {
#ifdef WIN32
  // Calling twice gives the same answer, nothing is cached in between
  REQUIRE(BackendSelector::isConPtyAvailable() ==
          BackendSelector::isConPtyAvailable());
#else
  REQUIRE_FALSE(BackendSelector::isConPtyAvailable());
  REQUIRE_FALSE(BackendSelector::isFallbackCompiled());
#endif
}

TEST_CASE("Backend and signal names", "[BackendSelector]") {
  REQUIRE(BackendSelector::backendName(BackendKind::UNIX) == "unix");
  REQUIRE(BackendSelector::backendName(BackendKind::CONPTY) == "conpty");
  REQUIRE(BackendSelector::backendName(BackendKind::WINPTY) == "winpty");
  REQUIRE(string(signalName(PtySignal::INTERRUPT)) == "Interrupt");
  REQUIRE(string(signalName(PtySignal::END_OF_INPUT)) == "EndOfInput");
}
