#include "subcue/subcue.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <asr_result.json> [options]\n"
        << "\nOptions:\n"
        << "  --min-length N  Soft-break merge threshold in characters "
           "(default: "
        << subcue::kDefaultMinMergeLength << ", range "
        << subcue::kMinMergeLengthLower << "-"
        << subcue::kMinMergeLengthUpper << ")\n"
        << "  --output PATH   Output file (default: input path with .srt "
           "or .txt)\n"
        << "  --text          Export the plain transcript instead of "
           "subtitles\n"
        << "  --stdout        Print the result instead of writing a file\n"
        << "  --cues          Show the cue list\n"
        << std::endl;
}

static std::string default_output_path(const std::string &input,
                                       bool text_mode) {
    std::filesystem::path p(input);
    p.replace_extension(text_mode ? subcue::kTextExtension
                                  : subcue::kSrtExtension);
    return p.string();
}

int main(int argc, char *argv[]) {
    using namespace subcue;
    using Clock = std::chrono::high_resolution_clock;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string input_path = argv[1];
        std::string output_path;
        int min_length = kDefaultMinMergeLength;
        bool text_mode = false;
        bool to_stdout = false;
        bool show_cues = false;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--text") {
                text_mode = true;
            } else if (arg == "--stdout") {
                to_stdout = true;
            } else if (arg == "--cues") {
                show_cues = true;
            } else if (arg == "--min-length" && i + 1 < argc) {
                min_length = std::stoi(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        int clamped = clamp_min_merge_length(min_length);
        if (clamped != min_length) {
            std::cerr << "Warning: --min-length " << min_length
                      << " out of range, using " << clamped << std::endl;
            min_length = clamped;
        }

        // In --stdout mode only the result goes to stdout
        std::ostream &info = to_stdout ? std::cerr : std::cout;

        // 1. Load recognizer result
        info << "Reading ASR result: " << input_path << std::endl;
        Subtitler subtitler(load_asr_result(input_path));
        info << "  Text: " << count_code_points(subtitler.text())
            << " characters, timestamps: "
            << subtitler.result().timestamps.size() << std::endl;

        if (subtitler.result().timestamps.empty() &&
            !subtitler.text().empty()) {
            std::cerr << "Warning: result has no timestamps, cue times will "
                         "be zero"
                      << std::endl;
        }

        // 2. Plain transcript
        if (text_mode) {
            if (to_stdout) {
                std::cout << subtitler.text() << std::endl;
            } else {
                if (output_path.empty())
                    output_path = default_output_path(input_path, true);
                subtitler.save_text(output_path);
                info << "Transcript written to: " << output_path << std::endl;
            }
            return 0;
        }

        // 3. Segment
        auto t0 = Clock::now();
        auto cues = subtitler.cues(min_length);
        auto t1 = Clock::now();
        info << "  Cues: " << cues.size() << " (min length " << min_length
            << ", "
            << std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0)
                   .count()
            << " us)" << std::endl;

        if (show_cues) {
            info << "\n--- Cues ---" << std::endl;
            for (const auto &c : cues) {
                info << "  [" << format_time(c.start_ms) << " - "
                    << format_time(c.end_ms) << "] " << c.text << std::endl;
            }
            info << std::endl;
        }

        // 4. Export
        if (to_stdout) {
            std::cout << to_srt(cues);
        } else {
            if (output_path.empty())
                output_path = default_output_path(input_path, false);
            write_srt(output_path, cues);
            info << "Subtitles written to: " << output_path << std::endl;
        }

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
