#include "ttswav.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;
static bool flag_big_endian = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--markdown")
            flag_markdown = true;
        else if (arg == "--big-endian")
            flag_big_endian = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Parse audio_sec from benchmark name like "pcm_to_wav/5/real_time"
static int parse_audio_sec(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return 0;
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    try {
        return std::stoi(arg_str);
    } catch (const std::exception &) {
        return 0;
    }
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

        std::cout << "| Stage | Audio (s) | Time (ms) | RTF | Throughput |\n";
        std::cout << "|-------|-----------|-----------|-----|------------|\n";

        for (const auto &r : runs_) {
            if (r.skipped != benchmark::internal::NotSkipped)
                continue;

            std::string name = r.benchmark_name();
            std::string stage = name.substr(0, name.find('/'));
            int audio_sec = parse_audio_sec(name);
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double rtf = audio_sec > 0 ? (time_ms / 1000.0) / audio_sec : 0;
            double throughput = rtf > 0 ? 1.0 / rtf : 0;

            std::cout << "| " << stage << " | " << audio_sec << " | "
                      << std::fixed << std::setprecision(3) << time_ms
                      << " | " << std::setprecision(6) << rtf << " | "
                      << std::setprecision(0) << throughput << "x |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic payload ──────────────────────────────────────────────────────

constexpr int SOURCE_RATE = 24000;

// Speech-like test signal: a few harmonics under a slow syllable envelope,
// with short gaps of digital silence.
static std::vector<uint8_t> make_payload(int audio_sec, bool big_endian) {
    size_t n = static_cast<size_t>(audio_sec) * SOURCE_RATE;
    std::vector<uint8_t> bytes(n * 2);
    for (size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / SOURCE_RATE;
        double env = std::max(0.0, std::sin(2.0 * M_PI * 3.0 * t));
        double s = 0.5 * std::sin(2.0 * M_PI * 180.0 * t) +
                   0.3 * std::sin(2.0 * M_PI * 360.0 * t) +
                   0.1 * std::sin(2.0 * M_PI * 1250.0 * t);
        auto v = static_cast<uint16_t>(
            static_cast<int16_t>(std::lround(s * env * 0.8 * 32767.0)));
        if (big_endian) {
            bytes[i * 2] = static_cast<uint8_t>(v >> 8);
            bytes[i * 2 + 1] = static_cast<uint8_t>(v);
        } else {
            bytes[i * 2] = static_cast<uint8_t>(v);
            bytes[i * 2 + 1] = static_cast<uint8_t>(v >> 8);
        }
    }
    return bytes;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> audio_durations = {1, 5, 10, 30};

static void add_duration_args(benchmark::Benchmark *b) {
    for (auto d : audio_durations)
        b->Arg(d);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    bool be = flag_big_endian;

    add_duration_args(benchmark::RegisterBenchmark(
        "resolve_byte_order", [be](benchmark::State &state) {
            int audio_sec = static_cast<int>(state.range(0));
            auto payload = make_payload(audio_sec, be);
            for (auto _ : state) {
                auto scan = ttswav::resolve_byte_order(payload);
                benchmark::DoNotOptimize(scan);
            }
            state.counters["Throughput"] =
                benchmark::Counter(audio_sec, benchmark::Counter::kIsRate);
        }));

    add_duration_args(benchmark::RegisterBenchmark(
        "resample_linear", [be](benchmark::State &state) {
            int audio_sec = static_cast<int>(state.range(0));
            auto payload = make_payload(audio_sec, be);
            auto order = be ? ttswav::ByteOrder::BigEndian
                            : ttswav::ByteOrder::LittleEndian;
            for (auto _ : state) {
                auto signal = ttswav::resample_linear(
                    payload.data(), payload.size(), order, SOURCE_RATE);
                benchmark::DoNotOptimize(signal.samples.data());
            }
            state.counters["Throughput"] =
                benchmark::Counter(audio_sec, benchmark::Counter::kIsRate);
        }));

    add_duration_args(benchmark::RegisterBenchmark(
        "pcm_to_wav", [be](benchmark::State &state) {
            int audio_sec = static_cast<int>(state.range(0));
            auto payload = make_payload(audio_sec, be);
            for (auto _ : state) {
                auto out = ttswav::pcm_to_wav(payload, SOURCE_RATE);
                benchmark::DoNotOptimize(out.wav.data());
            }
            state.counters["Throughput"] =
                benchmark::Counter(audio_sec, benchmark::Counter::kIsRate);
        }));

    add_duration_args(benchmark::RegisterBenchmark(
        "process_tts_payload", [be](benchmark::State &state) {
            int audio_sec = static_cast<int>(state.range(0));
            auto text = ttswav::base64_encode(make_payload(audio_sec, be));
            for (auto _ : state) {
                auto out = ttswav::process_tts_payload(
                    text, "audio/L16;codec=pcm;rate=24000");
                benchmark::DoNotOptimize(out.wav.data());
            }
            state.counters["Throughput"] =
                benchmark::Counter(audio_sec, benchmark::Counter::kIsRate);
        }));
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        std::cerr
            << "Usage: ttswav_bench [options] [benchmark flags]\n\n"
            << "Options:\n"
            << "  --big-endian        Feed byte-swapped PCM payloads\n"
            << "  --markdown          Output as markdown table\n"
            << "\nGoogle Benchmark flags (passed through):\n"
            << "  --benchmark_filter=REGEX\n"
            << "  --benchmark_repetitions=N\n"
            << "  --benchmark_format={console|json|csv}\n"
            << std::endl;
        return 1;
    }

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
