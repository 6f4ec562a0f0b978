#pragma once

#include <algorithm>

namespace subcue {

// ─── Merge Threshold Range ──────────────────────────────────────────────────

// Range offered to interactive callers (slider bounds) and the CLI default.
constexpr int kMinMergeLengthLower = 8;
constexpr int kMinMergeLengthUpper = 80;
constexpr int kDefaultMinMergeLength = 15;

// ─── Segment Config ─────────────────────────────────────────────────────────

struct SegmentConfig {
    // Minimum buffered character count (code points, punctuation included)
    // at which a soft break ends the current cue.
    int min_merge_length = kDefaultMinMergeLength;
};

inline int clamp_min_merge_length(int value) {
    return std::clamp(value, kMinMergeLengthLower, kMinMergeLengthUpper);
}

// ─── Presets ────────────────────────────────────────────────────────────────

inline SegmentConfig make_default_config() { return SegmentConfig{}; }

// Smallest threshold the range allows: breaks at nearly every comma.
inline SegmentConfig make_dense_config() {
    SegmentConfig cfg;
    cfg.min_merge_length = kMinMergeLengthLower;
    return cfg;
}

} // namespace subcue
