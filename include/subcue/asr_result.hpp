#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "subcue/segment.hpp"

namespace subcue {

// ─── Recognizer Output ──────────────────────────────────────────────────────

// Punctuated transcript plus one timestamp per content unit.
struct AsrResult {
    std::string text;
    std::vector<TimestampSpan> timestamps;
};

// Raised when a recognizer result document has the wrong shape or carries
// malformed timing data.
class AsrFormatError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// ─── Parsing ────────────────────────────────────────────────────────────────

/// Read a result document of the form
///
///   {"key": "...", "text": "你好。", "timestamp": [[0, 100], [100, 200]]}
///
/// or a batch array whose first element is such an object. A missing or
/// null "text" yields an empty transcript and a missing or null "timestamp"
/// an empty list; fractional milliseconds are truncated. Everything else
/// that does not match throws AsrFormatError.
AsrResult parse_asr_result(const nlohmann::json &doc);

// Parse JSON text; syntax errors are reported as AsrFormatError.
AsrResult parse_asr_json(const std::string &json_text);

// Load from a file. Throws std::runtime_error if it cannot be opened.
AsrResult load_asr_result(const std::string &path);

} // namespace subcue
