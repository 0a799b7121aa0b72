#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ttswav {

constexpr size_t WAV_HEADER_BYTES = 44;
constexpr int WAV_CHANNELS = 2;
constexpr int WAV_BITS_PER_SAMPLE = 16;

// Largest mono signal whose stereo data chunk still fits the 32-bit RIFF size
constexpr size_t WAV_MAX_FRAMES =
    (UINT32_MAX - 36) / (WAV_CHANNELS * (WAV_BITS_PER_SAMPLE / 8));

struct WavInfo {
    uint16_t audio_format; // 1 = PCM
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
    uint32_t riff_size;    // declared RIFF chunk size (file size - 8)
    uint32_t data_size;    // declared data chunk size
    size_t data_offset;    // byte offset of the first sample
    size_t num_frames;     // data_size / block_align
};

// Serialize mono samples as interleaved stereo 16-bit PCM WAV.
// Output is exactly 44 + samples.size() * 4 bytes. The header is parsed
// back and checked against the buffer before returning.
std::vector<uint8_t> encode_wav(const std::vector<float> &samples,
                                int sample_rate = 48000);

// Walk the RIFF chunks of an in-memory WAV (does not assume 44 bytes).
// Throws std::runtime_error on bad magic, missing chunks or truncation.
WavInfo parse_wav_header(const uint8_t *data, size_t len);

inline WavInfo parse_wav_header(const std::vector<uint8_t> &bytes) {
    return parse_wav_header(bytes.data(), bytes.size());
}

// round(s * 32767) clamped to int16
int16_t quantize_pcm16(float sample);

} // namespace ttswav
