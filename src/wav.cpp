#include "ttswav/wav.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ttswav {

namespace {

// All RIFF integers are little-endian regardless of host order
void put_u16(uint8_t *p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
}

void put_u32(uint8_t *p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

uint16_t get_u16(const uint8_t *p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

constexpr uint32_t FMT_CHUNK_SIZE = 16;
constexpr uint16_t FORMAT_PCM = 1;
constexpr uint32_t BLOCK_ALIGN = WAV_CHANNELS * (WAV_BITS_PER_SAMPLE / 8);

} // namespace

int16_t quantize_pcm16(float sample) {
    long q = std::lround(static_cast<double>(sample) * 32767.0);
    if (q > 32767)
        q = 32767;
    if (q < -32768)
        q = -32768;
    return static_cast<int16_t>(q);
}

std::vector<uint8_t> encode_wav(const std::vector<float> &samples,
                                int sample_rate) {
    if (sample_rate <= 0) {
        throw std::invalid_argument("WAV sample rate must be positive, got " +
                                    std::to_string(sample_rate));
    }

    uint64_t data_len = static_cast<uint64_t>(samples.size()) * BLOCK_ALIGN;
    if (samples.size() > WAV_MAX_FRAMES) {
        throw std::length_error("WAV data chunk too large: " +
                                std::to_string(data_len) + " bytes");
    }

    std::vector<uint8_t> out(WAV_HEADER_BYTES + data_len);
    uint8_t *h = out.data();

    // RIFF header
    std::memcpy(h + 0, "RIFF", 4);
    put_u32(h + 4, static_cast<uint32_t>(36 + data_len));
    std::memcpy(h + 8, "WAVE", 4);

    // fmt chunk
    std::memcpy(h + 12, "fmt ", 4);
    put_u32(h + 16, FMT_CHUNK_SIZE);
    put_u16(h + 20, FORMAT_PCM);
    put_u16(h + 22, WAV_CHANNELS);
    put_u32(h + 24, static_cast<uint32_t>(sample_rate));
    put_u32(h + 28, static_cast<uint32_t>(sample_rate) * BLOCK_ALIGN);
    put_u16(h + 32, static_cast<uint16_t>(BLOCK_ALIGN));
    put_u16(h + 34, WAV_BITS_PER_SAMPLE);

    // data chunk
    std::memcpy(h + 36, "data", 4);
    put_u32(h + 40, static_cast<uint32_t>(data_len));

    // Mono -> interleaved L/R
    uint8_t *p = h + WAV_HEADER_BYTES;
    for (float s : samples) {
        auto q = static_cast<uint16_t>(quantize_pcm16(s));
        put_u16(p, q);
        put_u16(p + 2, q);
        p += BLOCK_ALIGN;
    }

    // Verify what we wrote, not what we meant to write
    WavInfo info = parse_wav_header(out);
    if (info.data_offset != WAV_HEADER_BYTES ||
        info.data_size != data_len || info.riff_size + 8 != out.size() ||
        info.num_frames != samples.size()) {
        throw std::runtime_error("WAV encoder produced an inconsistent header");
    }

    return out;
}

WavInfo parse_wav_header(const uint8_t *data, size_t len) {
    if (len < 12 || std::memcmp(data, "RIFF", 4) != 0 ||
        std::memcmp(data + 8, "WAVE", 4) != 0) {
        throw std::runtime_error("Not a valid WAV buffer (missing RIFF/WAVE)");
    }

    WavInfo info{};
    info.riff_size = get_u32(data + 4);
    bool found_fmt = false;

    // Scan chunks (don't assume 44-byte header)
    size_t pos = 12;
    while (pos + 8 <= len) {
        const uint8_t *chunk = data + pos;
        uint32_t chunk_size = get_u32(chunk + 4);
        size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > len) {
                throw std::runtime_error("WAV: truncated fmt chunk");
            }
            info.audio_format = get_u16(data + body);
            info.num_channels = get_u16(data + body + 2);
            info.sample_rate = get_u32(data + body + 4);
            info.byte_rate = get_u32(data + body + 8);
            info.block_align = get_u16(data + body + 12);
            info.bits_per_sample = get_u16(data + body + 14);
            found_fmt = true;

        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!found_fmt) {
                throw std::runtime_error("WAV: data chunk before fmt chunk");
            }
            if (body + chunk_size > len) {
                throw std::runtime_error(
                    "WAV: data chunk declares " + std::to_string(chunk_size) +
                    " bytes but only " + std::to_string(len - body) +
                    " are present");
            }
            info.data_size = chunk_size;
            info.data_offset = body;
            info.num_frames =
                info.block_align > 0 ? chunk_size / info.block_align : 0;
            return info;
        }

        // Chunks are word-aligned
        pos = body + ((static_cast<size_t>(chunk_size) + 1) & ~size_t{1});
    }

    throw std::runtime_error(found_fmt ? "WAV: missing data chunk"
                                       : "WAV: missing fmt chunk");
}

} // namespace ttswav
