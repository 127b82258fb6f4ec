#ifndef __OX_UTF8_UTILS__
#define __OX_UTF8_UTILS__

#include "Headers.hpp"

namespace ox {
/** @brief UTF-8 helpers for turning raw pty output into displayable text. */
class Utf8Utils {
 public:
  enum class ScanResult { VALID, INVALID, INCOMPLETE };

  /**
   * @brief Classifies the sequence starting at `pos`.
   *
   * On VALID `length` is the sequence length. On INVALID it is the number of
   * bytes forming the maximal invalid subpart (at least 1), which is replaced
   * by a single U+FFFD. On INCOMPLETE it is the number of bytes available,
   * all of which are a valid prefix.
   */
  static ScanResult scan(const string& s, size_t pos, size_t* length);

  /** @brief Encodes one code point, or U+FFFD when it is not a scalar value. */
  static string encode(char32_t codepoint);

  /**
   * @brief Lossy decode of a complete buffer.
   *
   * Invalid and truncated sequences become U+FFFD. `replacements`, when set,
   * receives the number of substitutions made.
   */
  static string sanitize(const string& bytes, int* replacements = NULL);

  /**
   * @brief Index where the last character of `s` begins.
   *
   * Steps back over continuation bytes only as far as a lead byte that owns
   * them, so stray continuation bytes are removed one at a time.
   */
  static size_t lastCharacterStart(const string& s);

  static const char* REPLACEMENT_CHARACTER;
};

/**
 * @brief Lossy decoder for a chunked byte stream.
 *
 * A sequence split across chunks is held back until the rest arrives instead
 * of being replaced.
 */
class Utf8StreamDecoder {
 public:
  Utf8StreamDecoder() : replacements(0) {}

  /** @brief Decodes `bytes` after any held back prefix. */
  string decode(const string& bytes);

  /** @brief Emits U+FFFD for a held back prefix that will never complete. */
  string flush();

  bool hasPending() const { return !pending.empty(); }

  /** @brief Forgets a held back prefix without emitting anything. */
  void reset() { pending.clear(); }

  /** @brief Total substitutions made since construction. */
  int getReplacementCount() const { return replacements; }

 protected:
  string pending;
  int replacements;
};
}  // namespace ox

#endif  // __OX_UTF8_UTILS__
