#include "TestHeaders.hpp"
#include "Utf8Utils.hpp"

using namespace ox;

namespace {
const string REPLACEMENT = "\xEF\xBF\xBD";
}

TEST_CASE("sanitize keeps valid text untouched", "[Utf8Utils]") {
  int replacements = -1;
  const string text = "plain \xC3\xA9t\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
  REQUIRE(Utf8Utils::sanitize(text, &replacements) == text);
  REQUIRE(replacements == 0);
}

TEST_CASE("sanitize replaces malformed sequences", "[Utf8Utils]") {
  int replacements = 0;
  // Stray continuation byte, overlong encoding and a surrogate
  REQUIRE(Utf8Utils::sanitize("a\x80z", &replacements) ==
          "a" + REPLACEMENT + "z");
  REQUIRE(replacements == 1);
  REQUIRE(Utf8Utils::sanitize("\xC0\xAF") == REPLACEMENT + REPLACEMENT);
  REQUIRE(Utf8Utils::sanitize("\xED\xA0\x80") ==
          REPLACEMENT + REPLACEMENT + REPLACEMENT);
  // A truncated sequence is one replacement, then the next byte survives
  REQUIRE(Utf8Utils::sanitize("\xE2\x82(") == REPLACEMENT + "(");
  REQUIRE(Utf8Utils::sanitize("end\xF0\x9F") == "end" + REPLACEMENT);
}

TEST_CASE("encode produces UTF-8 for scalar values", "[Utf8Utils]") {
  REQUIRE(Utf8Utils::encode(U'a') == "a");
  REQUIRE(Utf8Utils::encode(0xE9) == "\xC3\xA9");
  REQUIRE(Utf8Utils::encode(0x20AC) == "\xE2\x82\xAC");
  REQUIRE(Utf8Utils::encode(0x1F600) == "\xF0\x9F\x98\x80");
  REQUIRE(Utf8Utils::encode(0xD800) == REPLACEMENT);
  REQUIRE(Utf8Utils::encode(0x110000) == REPLACEMENT);
}

TEST_CASE("lastCharacterStart steps over whole characters", "[Utf8Utils]") {
  REQUIRE(Utf8Utils::lastCharacterStart("") == 0);
  REQUIRE(Utf8Utils::lastCharacterStart("ab") == 1);
  REQUIRE(Utf8Utils::lastCharacterStart("a\xC3\xA9") == 1);
  REQUIRE(Utf8Utils::lastCharacterStart("x\xF0\x9F\x98\x80") == 1);
  // Stray continuation bytes go one at a time
  REQUIRE(Utf8Utils::lastCharacterStart("a\x80\x80") == 2);
}

TEST_CASE("Stream decoder holds back a split sequence", "[Utf8Utils]") {
  Utf8StreamDecoder decoder;
  REQUIRE(decoder.decode("price: \xE2\x82") == "price: ");
  REQUIRE(decoder.hasPending());
  REQUIRE(decoder.decode("\xAC!") == "\xE2\x82\xAC!");
  REQUIRE_FALSE(decoder.hasPending());
  REQUIRE(decoder.getReplacementCount() == 0);
}

TEST_CASE("Stream decoder flushes an unfinished tail", "[Utf8Utils]") {
  Utf8StreamDecoder decoder;
  REQUIRE(decoder.decode("ok\xF0\x9F") == "ok");
  REQUIRE(decoder.flush() == REPLACEMENT);
  REQUIRE(decoder.flush() == "");
  REQUIRE(decoder.getReplacementCount() == 1);
}

TEST_CASE("Stream decoder replaces a prefix broken by the next chunk",
          "[Utf8Utils]") {
  Utf8StreamDecoder decoder;
  REQUIRE(decoder.decode("\xC3") == "");
  REQUIRE(decoder.decode("A") == REPLACEMENT + "A");
  REQUIRE(decoder.getReplacementCount() == 1);
}
