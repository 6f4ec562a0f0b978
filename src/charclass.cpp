#include "subcue/charclass.hpp"

#include "subcue/utf8.hpp"

namespace subcue {

namespace {

bool is_hard_punctuation(char32_t cp) {
    switch (cp) {
    case U'。':
    case U'？':
    case U'！':
    case U'；':
    case U'：':
    case U'?':
    case U'!':
    case U';':
    case U':':
        return true;
    default:
        return false;
    }
}

bool is_soft_punctuation(char32_t cp) {
    return cp == U'，' || cp == U'、' || cp == U',';
}

} // namespace

bool is_line_break(char32_t cp) {
    switch (cp) {
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0x0085:
    case 0x2028:
    case 0x2029:
        return true;
    default:
        return false;
    }
}

bool is_whitespace(char32_t cp) {
    if (is_line_break(cp))
        return true;
    switch (cp) {
    case U' ':
    case U'\t':
    case 0x00A0: // no-break space
    case 0x1680: // ogham space mark
    case 0x202F: // narrow no-break space
    case 0x205F: // medium mathematical space
    case 0x3000: // ideographic space
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

UnitClass classify(char32_t cp) {
    if (is_hard_punctuation(cp) || is_line_break(cp))
        return UnitClass::HardBreak;
    if (is_soft_punctuation(cp) || is_whitespace(cp))
        return UnitClass::SoftBreak;
    return UnitClass::Content;
}

std::string trim_whitespace(const std::string &text) {
    auto units = decode_utf8(text);

    size_t first = 0;
    while (first < units.size() && is_whitespace(units[first].codepoint))
        ++first;
    if (first == units.size())
        return {};

    size_t last = units.size() - 1;
    while (last > first && is_whitespace(units[last].codepoint))
        --last;

    size_t begin = units[first].offset;
    size_t end = units[last].offset + units[last].length;
    return text.substr(begin, end - begin);
}

} // namespace subcue
