#pragma once

#include <string>
#include <utility>
#include <vector>

#include "subcue/asr_result.hpp"
#include "subcue/config.hpp"
#include "subcue/segment.hpp"
#include "subcue/srt.hpp"

namespace subcue {

// ─── High-Level Subtitle API ────────────────────────────────────────────────

/// Holds one recognizer result and turns it into subtitles on demand.
///
/// Every call recomputes the cues from scratch, so a caller that lets the
/// user tune the merge threshold simply asks again and replaces what it
/// shows:
///
///   subcue::Subtitler s(subcue::load_asr_result("result.json"));
///   auto cues = s.cues(15);
///   s.save_srt("subtitle.srt", 20);
///
class Subtitler {
  public:
    explicit Subtitler(AsrResult result) : result_(std::move(result)) {}

    std::vector<Cue> cues(int min_merge_length) const {
        return segment(result_.text, result_.timestamps, min_merge_length);
    }

    std::vector<Cue> cues(const SegmentConfig &config = {}) const {
        return cues(config.min_merge_length);
    }

    std::string srt(int min_merge_length = kDefaultMinMergeLength) const {
        return to_srt(cues(min_merge_length));
    }

    const std::string &text() const { return result_.text; }

    void save_srt(const std::string &path,
                  int min_merge_length = kDefaultMinMergeLength) const {
        write_srt(path, cues(min_merge_length));
    }

    void save_text(const std::string &path) const {
        write_text(path, result_.text);
    }

    const AsrResult &result() const { return result_; }

  private:
    AsrResult result_;
};

} // namespace subcue
