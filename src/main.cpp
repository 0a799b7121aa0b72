#include "ttswav.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <input> <output.wav> [options]\n"
        << "\nInput is base64 text as returned by the TTS provider.\n"
        << "\nOptions:\n"
        << "  --raw          Input file is raw headerless PCM, not base64\n"
        << "  --mime STR     Provider MIME type (e.g. audio/L16;rate=24000)\n"
        << "  --rate N       Source sample rate (overrides --mime rate)\n"
        << "  --volume V     Volume multiplier (default 1.0)\n"
        << "  --ceiling P    Peak ceiling as fraction of full scale "
           "(default 0.6)\n"
        << "  --data-url     Write a data:audio/wav;base64 URL instead of "
           "binary\n"
        << "  --verbose      Print pipeline telemetry\n"
        << std::endl;
}

static std::vector<uint8_t> read_file(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

static void write_file(const std::string &path, const char *data,
                       size_t len) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    file.write(data, static_cast<std::streamsize>(len));
    if (!file) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

static void print_report(const ttswav::PipelineReport &r) {
    using namespace ttswav;
    std::cerr << "  Source: " << format_name(r.source_format) << ", "
              << r.source_rate << " Hz, " << r.source_samples << " samples"
              << std::endl;
    if (r.source_format == AudioFormat::PCM16) {
        std::cerr << "  Byte order: " << byte_order_name(r.scan.order)
                  << (r.scan.decisive ? "" : " (default)") << " (MAV LE: "
                  << std::fixed << std::setprecision(0) << r.scan.mav_le
                  << ", BE: " << r.scan.mav_be << ", scanned "
                  << r.scan.scanned << ")" << std::endl;
    }
    std::cerr << std::fixed << std::setprecision(1);
    if (r.gain.clamped) {
        std::cerr << "  Normalization applied: peak " << r.input_peak * 100.0f
                  << "% -> " << r.output_peak * 100.0f << "%" << std::endl;
    }
    std::cerr << "  Output: " << r.output_rate << " Hz stereo, "
              << r.output_samples << " samples, gain "
              << std::setprecision(3) << r.gain.gain << ", fade "
              << r.gain.fade_samples << " samples" << std::endl;
    std::cerr << "  Final peak: " << std::setprecision(1)
              << r.output_peak * 100.0f << "%, buffer " << r.wav_bytes
              << " bytes" << std::endl;
}

int main(int argc, char *argv[]) {
    using namespace ttswav;
    using Clock = std::chrono::high_resolution_clock;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string input_path = argv[1];
        std::string output_path = argv[2];
        bool raw_input = false;
        bool data_url = false;
        bool verbose = false;
        std::string mime;
        int rate = 0;
        float volume = 1.0f;
        PipelineConfig config = make_speech_config();

        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--raw") {
                raw_input = true;
            } else if (arg == "--data-url") {
                data_url = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--mime" && i + 1 < argc) {
                mime = argv[++i];
            } else if (arg == "--rate" && i + 1 < argc) {
                rate = std::stoi(argv[++i]);
            } else if (arg == "--volume" && i + 1 < argc) {
                volume = std::stof(argv[++i]);
            } else if (arg == "--ceiling" && i + 1 < argc) {
                config.gain.peak_ceiling = std::stof(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (config.gain.peak_ceiling <= 0.0f ||
            config.gain.peak_ceiling > 1.0f) {
            std::cerr << "Error: --ceiling must be in (0, 1]" << std::endl;
            return 1;
        }

        // An explicit rate wins over whatever the MIME string declares
        if (rate > 0) {
            config.default_source_rate = rate;
            if (detect_format_by_mime(mime) == AudioFormat::PCM16)
                mime.clear();
        }

        // 1. Read payload
        auto input = read_file(input_path);
        if (verbose) {
            std::cerr << "Reading payload: " << input_path << " ("
                      << input.size() << " bytes"
                      << (raw_input ? ", raw PCM" : ", base64") << ")"
                      << std::endl;
        }

        // 2. Run pipeline
        auto t0 = Clock::now();
        SpeechAudio result;
        if (raw_input) {
            result = pcm_to_wav(input, config.default_source_rate, volume,
                                config);
        } else {
            std::string text(input.begin(), input.end());
            result = process_tts_payload(text, mime, volume, config);
        }
        auto t1 = Clock::now();

        if (verbose) {
            print_report(result.report);
            std::cerr << "  Pipeline: "
                      << std::chrono::duration_cast<std::chrono::microseconds>(
                             t1 - t0)
                             .count()
                      << " us" << std::endl;
        }

        // 3. Write output
        if (data_url) {
            std::string url = "data:audio/wav;base64," + base64_encode(result.wav);
            write_file(output_path, url.data(), url.size());
        } else {
            write_file(output_path,
                       reinterpret_cast<const char *>(result.wav.data()),
                       result.wav.size());
        }

        std::cout << "Wrote " << output_path << " (" << result.wav.size()
                  << " bytes, " << result.report.output_samples
                  << " samples @ " << result.report.output_rate << " Hz)"
                  << std::endl;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
