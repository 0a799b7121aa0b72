#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ttswav/format.hpp"
#include "ttswav/byte_order.hpp"
#include "ttswav/config.hpp"
#include "ttswav/normalize.hpp"

namespace ttswav {

// ─── Telemetry ──────────────────────────────────────────────────────────────

struct PipelineReport {
    AudioFormat source_format = AudioFormat::PCM16;
    int source_rate = 0;
    size_t source_samples = 0;
    ByteOrderScan scan;        // only meaningful for PCM16 input
    int output_rate = 0;
    size_t output_samples = 0;
    float input_peak = 0.0f;   // resampled, pre-gain
    GainPlan gain{1.0f, 0, false};
    float output_peak = 0.0f;  // input_peak * gain
    size_t wav_bytes = 0;
};

struct SpeechAudio {
    std::vector<uint8_t> wav; // 48 kHz stereo 16-bit PCM WAV
    PipelineReport report;
};

// ─── Entry Points ───────────────────────────────────────────────────────────

// Headerless mono 16-bit PCM -> WAV.
//   resolve byte order -> resample -> gain plan -> envelope -> encode
// Throws EmptyPayloadError if len < 2.
SpeechAudio pcm_to_wav(const uint8_t *pcm, size_t len, int source_rate,
                       float volume = 1.0f,
                       const PipelineConfig &config = make_speech_config());

inline SpeechAudio
pcm_to_wav(const std::vector<uint8_t> &pcm, int source_rate,
           float volume = 1.0f,
           const PipelineConfig &config = make_speech_config()) {
    return pcm_to_wav(pcm.data(), pcm.size(), source_rate, volume, config);
}

// Already decoded mono samples -> WAV (skips the byte order scan).
SpeechAudio samples_to_wav(const std::vector<float> &mono, int source_rate,
                           float volume = 1.0f,
                           const PipelineConfig &config = make_speech_config());

// Provider payload as received: base64 text plus its MIME type.
// L16 / pcm MIME types go through pcm_to_wav at the declared rate (or the
// config default); container MIME types are decoded first. An unknown MIME
// falls back to magic-byte sniffing.
SpeechAudio
process_tts_payload(const std::string &base64_data,
                    const std::string &mime_type, float volume = 1.0f,
                    const PipelineConfig &config = make_speech_config());

} // namespace ttswav
