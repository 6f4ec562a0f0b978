#pragma once

#include <string>

namespace subcue {

// ─── Unit Classification ────────────────────────────────────────────────────

enum class UnitClass {
    HardBreak, // always ends the current cue (。？！；：?!;: and line breaks)
    SoftBreak, // ends the cue once it is long enough (，、, and whitespace)
    Content,   // consumes one timestamp
};

// \n \r \v \f U+0085 U+2028 U+2029
bool is_line_break(char32_t cp);

// Unicode White_Space, line breaks included.
bool is_whitespace(char32_t cp);

// Checked in priority order: hard break, soft break, content.
UnitClass classify(char32_t cp);

inline bool is_break(char32_t cp) { return classify(cp) != UnitClass::Content; }

// Strip leading and trailing whitespace code points.
std::string trim_whitespace(const std::string &text);

} // namespace subcue
