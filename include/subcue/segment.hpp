#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "subcue/config.hpp"

namespace subcue {

// ─── Timing Types ───────────────────────────────────────────────────────────

// Recognizer timing for one content unit, in milliseconds.
struct TimestampSpan {
    int64_t start_ms;
    int64_t end_ms;
};

// One subtitle entry.
struct Cue {
    int index;        // 1-based, gapless
    int64_t start_ms; // >= 0
    int64_t end_ms;   // >= start_ms
    std::string text; // trimmed, never empty
};

// ─── Segmentation ───────────────────────────────────────────────────────────

/// Split recognized text into timed subtitle cues.
///
/// Every code point of `text` is a unit. Content units (anything that is not
/// break punctuation or whitespace) take the next entry of `timestamps`, in
/// order. Hard breaks (。？！；：?!;: and line breaks) always end the cue.
/// Soft breaks (，、, and whitespace) end it only once the buffered cue,
/// punctuation included, holds at least `min_merge_length` code points;
/// shorter fragments merge into the following one.
///
/// Content units past the end of `timestamps` keep the last known end time;
/// a cue without any timestamp gets that time as both bounds. Cues made only
/// of punctuation or whitespace are dropped.
///
///   auto cues = subcue::segment("你好。世界！",
///                               {{0, 100}, {100, 200}, {200, 300},
///                                {300, 400}},
///                               15);
///   // cues[0] = {1, 0, 200, "你好。"}, cues[1] = {2, 200, 400, "世界！"}
///
/// Spans that end before they start are accepted; a cue's end is never
/// earlier than its start.
///
/// Throws std::invalid_argument if min_merge_length <= 0 or a timestamp
/// holds a negative time.
std::vector<Cue> segment(const std::string &text,
                         const std::vector<TimestampSpan> &timestamps,
                         int min_merge_length);

std::vector<Cue> segment(const std::string &text,
                         const std::vector<TimestampSpan> &timestamps,
                         const SegmentConfig &config = {});

} // namespace subcue
