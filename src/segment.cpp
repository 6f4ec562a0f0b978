#include "subcue/segment.hpp"

#include "subcue/charclass.hpp"
#include "subcue/utf8.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace subcue {

namespace {

void validate_timestamps(const std::vector<TimestampSpan> &timestamps) {
    for (size_t i = 0; i < timestamps.size(); ++i) {
        const auto &ts = timestamps[i];
        if (ts.start_ms < 0 || ts.end_ms < 0) {
            throw std::invalid_argument(
                "Invalid timestamp #" + std::to_string(i) + ": [" +
                std::to_string(ts.start_ms) + ", " +
                std::to_string(ts.end_ms) + "]");
        }
    }
}

// The cue being accumulated.
struct PendingCue {
    std::string text;
    size_t units = 0;              // code points buffered so far
    std::optional<int64_t> start;  // unset until a content unit is timed
    bool has_content = false;

    void reset() {
        text.clear();
        units = 0;
        start.reset();
        has_content = false;
    }
};

class CueBuilder {
  public:
    explicit CueBuilder(const std::vector<TimestampSpan> &timestamps)
        : timestamps_(timestamps) {}

    void append(const std::string &source, const Utf8Unit &unit,
                UnitClass cls) {
        pending_.text.append(source, unit.offset, unit.length);
        ++pending_.units;

        if (cls != UnitClass::Content)
            return;

        pending_.has_content = true;
        if (cursor_ < timestamps_.size()) {
            const auto &ts = timestamps_[cursor_++];
            if (!pending_.start)
                pending_.start = ts.start_ms;
            last_end_ = ts.end_ms;
        }
    }

    size_t pending_units() const { return pending_.units; }

    void flush() {
        if (pending_.has_content) {
            auto text = trim_whitespace(pending_.text);
            if (!text.empty()) {
                int64_t start = pending_.start.value_or(last_end_);
                int64_t end = std::max(last_end_, start);
                cues_.push_back({static_cast<int>(cues_.size()) + 1, start,
                                 end, std::move(text)});
            }
        }
        pending_.reset();
    }

    std::vector<Cue> take() { return std::move(cues_); }

  private:
    const std::vector<TimestampSpan> &timestamps_;
    size_t cursor_ = 0;
    int64_t last_end_ = 0; // survives flushes
    PendingCue pending_;
    std::vector<Cue> cues_;
};

} // namespace

std::vector<Cue> segment(const std::string &text,
                         const std::vector<TimestampSpan> &timestamps,
                         int min_merge_length) {
    if (min_merge_length <= 0) {
        throw std::invalid_argument("min_merge_length must be positive, got " +
                                    std::to_string(min_merge_length));
    }
    validate_timestamps(timestamps);

    if (text.empty())
        return {};

    const auto threshold = static_cast<size_t>(min_merge_length);
    CueBuilder builder(timestamps);

    for (const auto &unit : decode_utf8(text)) {
        auto cls = classify(unit.codepoint);
        builder.append(text, unit, cls);

        if (cls == UnitClass::HardBreak) {
            builder.flush();
        } else if (cls == UnitClass::SoftBreak &&
                   builder.pending_units() >= threshold) {
            builder.flush();
        }
    }

    // Unterminated tail
    builder.flush();

    return builder.take();
}

std::vector<Cue> segment(const std::string &text,
                         const std::vector<TimestampSpan> &timestamps,
                         const SegmentConfig &config) {
    return segment(text, timestamps, config.min_merge_length);
}

} // namespace subcue
