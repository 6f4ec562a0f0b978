#include "subcue/srt.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace subcue {

namespace {

void write_file(const std::string &path, const std::string &content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

} // namespace

std::string format_time(int64_t ms) {
    if (ms < 0) {
        throw std::invalid_argument("Cannot format negative time: " +
                                    std::to_string(ms) + " ms");
    }

    int64_t hours = ms / 3600000;
    int64_t minutes = (ms / 60000) % 60;
    int64_t seconds = (ms / 1000) % 60;
    int64_t millis = ms % 1000;

    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << hours << ':' << std::setw(2)
        << minutes << ':' << std::setw(2) << seconds << ',' << std::setw(3)
        << millis;
    return out.str();
}

std::string to_srt(const std::vector<Cue> &cues) {
    std::string out;
    for (const auto &cue : cues) {
        out += std::to_string(cue.index);
        out += '\n';
        out += format_time(cue.start_ms);
        out += " --> ";
        out += format_time(cue.end_ms);
        out += '\n';
        out += cue.text;
        out += "\n\n";
    }
    return out;
}

void write_srt(const std::string &path, const std::vector<Cue> &cues) {
    write_file(path, to_srt(cues));
}

void write_text(const std::string &path, const std::string &text) {
    write_file(path, text);
}

} // namespace subcue
