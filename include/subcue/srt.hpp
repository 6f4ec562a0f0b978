#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "subcue/segment.hpp"

namespace subcue {

// ─── Export Formats ─────────────────────────────────────────────────────────

constexpr const char *kSrtExtension = ".srt";
constexpr const char *kTextExtension = ".txt";
constexpr const char *kSrtMimeType = "text/plain";

// ─── SRT Serialization ──────────────────────────────────────────────────────

// Milliseconds → "HH:MM:SS,mmm". Hours widen past two digits when needed.
// Throws std::invalid_argument for negative input.
std::string format_time(int64_t ms);

// One block per cue: index, "start --> end", text, blank line.
std::string to_srt(const std::vector<Cue> &cues);

// Write to_srt(cues) to a file. Throws std::runtime_error on I/O failure.
void write_srt(const std::string &path, const std::vector<Cue> &cues);

// Write a plain transcript. Throws std::runtime_error on I/O failure.
void write_text(const std::string &path, const std::string &text);

} // namespace subcue
