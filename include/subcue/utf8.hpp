#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace subcue {

// ─── UTF-8 Units ────────────────────────────────────────────────────────────

// U+FFFD, reported for bytes that do not start a valid sequence.
constexpr char32_t kReplacementChar = 0xFFFD;

// One code point of the source text and the bytes it occupies there.
struct Utf8Unit {
    char32_t codepoint;
    size_t offset; // byte offset into the source string
    size_t length; // 1..4 bytes
};

// Split UTF-8 text into code points.
// Malformed bytes (stray continuation bytes, truncated or overlong
// sequences, surrogates) become single-byte units with kReplacementChar,
// so every input byte belongs to exactly one unit.
std::vector<Utf8Unit> decode_utf8(const std::string &text);

// Number of units decode_utf8() would return.
size_t count_code_points(const std::string &text);

} // namespace subcue
