#include "Utf8Utils.hpp"

namespace ox {
const char* Utf8Utils::REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

namespace {
inline bool inRange(unsigned char c, unsigned char low, unsigned char high) {
  return c >= low && c <= high;
}
}  // namespace

Utf8Utils::ScanResult Utf8Utils::scan(const string& s, size_t pos,
                                      size_t* length) {
  unsigned char lead = (unsigned char)s[pos];
  size_t expected;
  // Allowed range of the first continuation byte, which excludes overlong
  // forms, surrogates and code points above U+10FFFF.
  unsigned char low = 0x80, high = 0xBF;
  if (lead < 0x80) {
    *length = 1;
    return ScanResult::VALID;
  } else if (inRange(lead, 0xC2, 0xDF)) {
    expected = 2;
  } else if (lead == 0xE0) {
    expected = 3;
    low = 0xA0;
  } else if (lead == 0xED) {
    expected = 3;
    high = 0x9F;
  } else if (inRange(lead, 0xE1, 0xEF)) {
    expected = 3;
  } else if (lead == 0xF0) {
    expected = 4;
    low = 0x90;
  } else if (lead == 0xF4) {
    expected = 4;
    high = 0x8F;
  } else if (inRange(lead, 0xF1, 0xF3)) {
    expected = 4;
  } else {
    *length = 1;
    return ScanResult::INVALID;
  }

  size_t i = 1;
  for (; i < expected; i++) {
    if (pos + i >= s.size()) {
      *length = i;
      return ScanResult::INCOMPLETE;
    }
    unsigned char c = (unsigned char)s[pos + i];
    bool ok = (i == 1) ? inRange(c, low, high) : inRange(c, 0x80, 0xBF);
    if (!ok) {
      *length = i;
      return ScanResult::INVALID;
    }
  }
  *length = expected;
  return ScanResult::VALID;
}

string Utf8Utils::encode(char32_t codepoint) {
  string out;
  if (codepoint < 0x80) {
    out.push_back((char)codepoint);
  } else if (codepoint < 0x800) {
    out.push_back((char)(0xC0 | (codepoint >> 6)));
    out.push_back((char)(0x80 | (codepoint & 0x3F)));
  } else if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
    out = REPLACEMENT_CHARACTER;
  } else if (codepoint < 0x10000) {
    out.push_back((char)(0xE0 | (codepoint >> 12)));
    out.push_back((char)(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (codepoint & 0x3F)));
  } else if (codepoint <= 0x10FFFF) {
    out.push_back((char)(0xF0 | (codepoint >> 18)));
    out.push_back((char)(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back((char)(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (codepoint & 0x3F)));
  } else {
    out = REPLACEMENT_CHARACTER;
  }
  return out;
}

string Utf8Utils::sanitize(const string& bytes, int* replacements) {
  Utf8StreamDecoder decoder;
  string out = decoder.decode(bytes);
  out += decoder.flush();
  if (replacements) {
    *replacements = decoder.getReplacementCount();
  }
  return out;
}

size_t Utf8Utils::lastCharacterStart(const string& s) {
  if (s.empty()) {
    return 0;
  }
  // A character is at most four bytes, so look no further back than that.
  size_t earliest = s.size() > 4 ? s.size() - 4 : 0;
  for (size_t start = s.size() - 1;; start--) {
    unsigned char c = (unsigned char)s[start];
    if (!inRange(c, 0x80, 0xBF)) {
      size_t length;
      if (scan(s, start, &length) == ScanResult::VALID &&
          start + length == s.size()) {
        return start;
      }
      break;
    }
    if (start == earliest) {
      break;
    }
  }
  return s.size() - 1;
}

string Utf8StreamDecoder::decode(const string& bytes) {
  string input = pending + bytes;
  pending.clear();
  string out;
  out.reserve(input.size());
  size_t pos = 0;
  while (pos < input.size()) {
    size_t length;
    switch (Utf8Utils::scan(input, pos, &length)) {
      case Utf8Utils::ScanResult::VALID:
        out.append(input, pos, length);
        break;
      case Utf8Utils::ScanResult::INVALID:
        out += Utf8Utils::REPLACEMENT_CHARACTER;
        replacements++;
        break;
      case Utf8Utils::ScanResult::INCOMPLETE:
        pending = input.substr(pos);
        break;
    }
    pos += length;
  }
  return out;
}

string Utf8StreamDecoder::flush() {
  if (pending.empty()) {
    return string();
  }
  pending.clear();
  replacements++;
  return Utf8Utils::REPLACEMENT_CHARACTER;
}
}  // namespace ox
