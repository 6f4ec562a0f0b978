#include "subcue/subcue.hpp"

#include <benchmark/benchmark.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static std::string flag_input;
static bool flag_markdown = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--input="))
            flag_input = arg.substr(8);
        else if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Each benchmark records what it segmented as user counters.
static double counter(const benchmark::BenchmarkReporter::Run &r,
                      const std::string &key) {
    auto it = r.counters.find(key);
    return it != r.counters.end() ? it->second.value : 0.0;
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Min length | Characters | Cues | "
                     "Time (us) | Characters/us |\n";
        std::cout << "|-----------|------------|------------|------|"
                     "-----------|---------------|\n";

        for (const auto &r : runs_) {
            double chars = counter(r, "characters");
            double time_us = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1e6;

            std::cout << "| " << r.benchmark_name() << " | " << std::fixed
                      << std::setprecision(0) << counter(r, "min_length")
                      << " | " << chars << " | " << counter(r, "cues")
                      << " | " << std::setprecision(1) << time_us << " | "
                      << (time_us > 0 ? chars / time_us : 0.0) << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

static void record_counters(benchmark::State &state,
                            const subcue::AsrResult &result, int threshold,
                            size_t cues) {
    state.counters["min_length"] = static_cast<double>(threshold);
    state.counters["characters"] =
        static_cast<double>(subcue::count_code_points(result.text));
    state.counters["cues"] = static_cast<double>(cues);
}

// ─── Synthetic transcripts ──────────────────────────────────────────────────

static const std::vector<std::string> phrases = {
    "今天天气很好，",  "我们一起去公园散步吧。", "你吃饭了吗？",
    "这个问题很复杂，", "需要仔细想一想，",       "然后再做决定！",
    "好的；",          "注意：",                 "明天见。",
};

// `sentences` phrases joined back to back, 200 ms per content unit.
static subcue::AsrResult make_transcript(int sentences) {
    subcue::AsrResult result;
    for (int i = 0; i < sentences; ++i)
        result.text += phrases[static_cast<size_t>(i) % phrases.size()];

    int64_t t = 0;
    for (const auto &unit : subcue::decode_utf8(result.text)) {
        if (subcue::is_break(unit.codepoint))
            continue;
        result.timestamps.push_back({t, t + 200});
        t += 200;
    }
    return result;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> sentence_counts = {100, 1000, 10000};
static const std::vector<int> thresholds = {8, 15, 40, 80};

static void add_sentence_args(benchmark::internal::Benchmark *b) {
    for (auto n : sentence_counts)
        b->Arg(n);
    b->UseRealTime()->Unit(benchmark::kMicrosecond);
}

static std::unique_ptr<subcue::AsrResult> input_result;

static void register_benchmarks() {
    for (int threshold : thresholds) {
        add_sentence_args(benchmark::RegisterBenchmark(
            ("segment_" + std::to_string(threshold)).c_str(),
            [threshold](benchmark::State &state) {
                auto result =
                    make_transcript(static_cast<int>(state.range(0)));
                size_t n_cues = 0;
                for (auto _ : state) {
                    auto cues = subcue::segment(result.text,
                                                result.timestamps, threshold);
                    n_cues = cues.size();
                    benchmark::DoNotOptimize(cues);
                }
                record_counters(state, result, threshold, n_cues);
                state.SetBytesProcessed(
                    static_cast<int64_t>(state.iterations()) *
                    static_cast<int64_t>(result.text.size()));
            }));
    }

    add_sentence_args(benchmark::RegisterBenchmark(
        "to_srt_15", [](benchmark::State &state) {
            auto result = make_transcript(static_cast<int>(state.range(0)));
            auto cues = subcue::segment(result.text, result.timestamps, 15);
            for (auto _ : state) {
                auto srt = subcue::to_srt(cues);
                benchmark::DoNotOptimize(srt);
            }
            record_counters(state, result, 15, cues.size());
        }));

    // Real recognizer output, one pass per threshold
    if (input_result) {
        for (int threshold : thresholds) {
            benchmark::RegisterBenchmark(
                ("input_" + std::to_string(threshold)).c_str(),
                [threshold](benchmark::State &state) {
                    size_t n_cues = 0;
                    for (auto _ : state) {
                        auto cues =
                            subcue::segment(input_result->text,
                                            input_result->timestamps,
                                            threshold);
                        n_cues = cues.size();
                        benchmark::DoNotOptimize(cues);
                    }
                    record_counters(state, *input_result, threshold, n_cues);
                })
                ->UseRealTime()
                ->Unit(benchmark::kMicrosecond);
        }
    }
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    if (!flag_input.empty()) {
        try {
            input_result = std::make_unique<subcue::AsrResult>(
                subcue::load_asr_result(flag_input));
            std::cerr << "Loaded " << flag_input << " ("
                      << input_result->timestamps.size() << " timestamps)"
                      << std::endl;
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
