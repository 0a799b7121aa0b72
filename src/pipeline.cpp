#include "ttswav/pipeline.hpp"

#include "ttswav/audio_io.hpp"
#include "ttswav/base64.hpp"
#include "ttswav/errors.hpp"
#include "ttswav/mime.hpp"
#include "ttswav/resample.hpp"
#include "ttswav/wav.hpp"

#include <string>
#include <utility>

namespace ttswav {

namespace {

// Normalize, envelope and encode a resampled signal; fills the tail of the
// report.
SpeechAudio finish(ResampledSignal &&signal, float volume,
                   const PipelineConfig &config, PipelineReport report) {
    GainPlan plan = compute_gain_plan(signal.peak, signal.sample_rate, volume,
                                      config.gain);
    apply_gain_inplace(signal.samples, plan);

    report.output_rate = signal.sample_rate;
    report.output_samples = signal.samples.size();
    report.input_peak = signal.peak;
    report.gain = plan;
    report.output_peak = signal.peak * plan.gain;

    SpeechAudio out{encode_wav(signal.samples, signal.sample_rate), report};
    out.report.wav_bytes = out.wav.size();
    return out;
}

} // namespace

SpeechAudio pcm_to_wav(const uint8_t *pcm, size_t len, int source_rate,
                       float volume, const PipelineConfig &config) {
    if (len < 2) {
        throw EmptyPayloadError(
            "PCM payload holds no 16-bit samples (" + std::to_string(len) +
            " bytes)");
    }

    PipelineReport report;
    report.source_format = AudioFormat::PCM16;
    report.source_rate = source_rate;
    report.source_samples = len / 2;
    report.scan = resolve_byte_order(pcm, len, config.byte_order);

    auto signal = resample_linear(pcm, len, report.scan.order, source_rate,
                                  config.target_rate);
    return finish(std::move(signal), volume, config, report);
}

SpeechAudio samples_to_wav(const std::vector<float> &mono, int source_rate,
                           float volume, const PipelineConfig &config) {
    if (mono.empty()) {
        throw EmptyPayloadError("Sample buffer is empty");
    }

    PipelineReport report;
    report.source_format = AudioFormat::Unknown;
    report.source_rate = source_rate;
    report.source_samples = mono.size();

    auto signal = resample_linear(mono, source_rate, config.target_rate);
    return finish(std::move(signal), volume, config, report);
}

SpeechAudio process_tts_payload(const std::string &base64_data,
                                const std::string &mime_type, float volume,
                                const PipelineConfig &config) {
    auto bytes = base64_decode(base64_data);
    if (bytes.empty()) {
        throw EmptyPayloadError("TTS payload is empty");
    }

    MimeInfo mime = parse_mime_type(mime_type, config.default_source_rate);

    AudioFormat fmt = mime.format;
    if (fmt == AudioFormat::Unknown) {
        fmt = detect_format_by_magic(bytes.data(), bytes.size());
        if (fmt == AudioFormat::Unknown) {
            throw UnsupportedFormatError("Unrecognized TTS audio type: " +
                                         mime_type);
        }
    }

    if (fmt == AudioFormat::PCM16) {
        return pcm_to_wav(bytes.data(), bytes.size(), mime.sample_rate, volume,
                          config);
    }

    auto decoded = decode_audio(bytes.data(), bytes.size(), fmt);
    auto out = samples_to_wav(to_vector(decoded.samples), decoded.sample_rate,
                              volume, config);
    out.report.source_format = decoded.format;
    return out;
}

} // namespace ttswav
