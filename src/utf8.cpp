#include "subcue/utf8.hpp"

namespace subcue {

namespace {

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

// Decode the sequence starting at text[pos]. Returns the byte length and
// writes the code point, or returns 0 if the bytes are malformed.
size_t decode_one(const std::string &text, size_t pos, char32_t &out) {
    const auto b0 = static_cast<unsigned char>(text[pos]);
    size_t len = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;

    if (b0 < 0x80) {
        out = b0;
        return 1;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        cp = b0 & 0x1F;
        min_cp = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        cp = b0 & 0x0F;
        min_cp = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        cp = b0 & 0x07;
        min_cp = 0x10000;
    } else {
        return 0;
    }

    if (pos + len > text.size())
        return 0;

    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(b))
            return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF are rejected
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;

    out = cp;
    return len;
}

} // namespace

std::vector<Utf8Unit> decode_utf8(const std::string &text) {
    std::vector<Utf8Unit> units;
    units.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_one(text, pos, cp);
        if (len == 0) {
            units.push_back({kReplacementChar, pos, 1});
            ++pos;
            continue;
        }
        units.push_back({cp, pos, len});
        pos += len;
    }
    return units;
}

size_t count_code_points(const std::string &text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_one(text, pos, cp);
        pos += (len == 0) ? 1 : len;
        ++count;
    }
    return count;
}

} // namespace subcue
