// Container decoding for provider payloads that are not raw PCM
//
// Uses single-header C decoders:
//   - dr_wav, dr_flac, dr_mp3 (mackron/dr_libs)
//   - stb_vorbis (nothings/stb)

#define DR_WAV_IMPLEMENTATION
#define DR_FLAC_IMPLEMENTATION
#define DR_MP3_IMPLEMENTATION

#include "dr_wav.h"
#include "dr_flac.h"
#include "dr_mp3.h"

// stb_vorbis is a .c file — include as extern "C", then clean up leaked macros
extern "C" {
#include "stb_vorbis.c"
}
#undef C
#undef R
#undef L

#include "ttswav/audio_io.hpp"
#include "ttswav/errors.hpp"

#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ttswav {

std::vector<float> to_vector(const axiom::Tensor &samples) {
    auto cont = samples.ascontiguousarray();
    const float *data = cont.typed_data<float>();
    size_t len = cont.shape()[0];
    return std::vector<float>(data, data + len);
}

namespace {

// Downmix interleaved multi-channel to mono
std::vector<float> downmix_to_mono(const float *interleaved, size_t total,
                                   int channels) {
    if (channels == 1) {
        return std::vector<float>(interleaved, interleaved + total);
    }
    size_t frames = total / channels;
    std::vector<float> mono(frames);
    float inv_ch = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = sum * inv_ch;
    }
    return mono;
}

DecodedAudio make_decoded_audio(std::vector<float> &&mono, int sample_rate,
                                int channels, AudioFormat fmt) {
    if (mono.empty()) {
        throw EmptyPayloadError(std::string("Decoded ") + format_name(fmt) +
                                " payload contains no samples");
    }
    int num_samples = static_cast<int>(mono.size());
    float duration =
        static_cast<float>(num_samples) / static_cast<float>(sample_rate);

    auto tensor = axiom::Tensor::from_data(
        mono.data(), axiom::Shape{static_cast<size_t>(num_samples)}, true);

    return DecodedAudio{
        std::move(tensor), sample_rate, channels, num_samples, duration, fmt,
    };
}

// WAV via dr_wav
DecodedAudio decode_wav(const uint8_t *data, size_t len) {
    drwav wav;
    if (!drwav_init_memory(&wav, data, len, nullptr)) {
        throw std::runtime_error("Cannot decode WAV from memory buffer");
    }

    size_t total_frames = wav.totalPCMFrameCount;
    int channels = wav.channels;
    int sample_rate = wav.sampleRate;

    std::vector<float> interleaved(total_frames * channels);
    size_t frames_read =
        drwav_read_pcm_frames_f32(&wav, total_frames, interleaved.data());
    drwav_uninit(&wav);

    interleaved.resize(frames_read * channels);

    auto mono =
        downmix_to_mono(interleaved.data(), interleaved.size(), channels);
    return make_decoded_audio(std::move(mono), sample_rate, channels,
                              AudioFormat::WAV);
}

// dr_flac / dr_mp3 / stb_vorbis hand back malloc'd interleaved buffers
struct FlacFree {
    void operator()(float *p) const { drflac_free(p, nullptr); }
};
struct Mp3Free {
    void operator()(float *p) const { drmp3_free(p, nullptr); }
};
struct CFree {
    void operator()(short *p) const { std::free(p); }
};

void check_stream_shape(AudioFormat fmt, int channels, int sample_rate) {
    if (channels <= 0 || sample_rate <= 0) {
        throw std::runtime_error(std::string("Invalid ") + format_name(fmt) +
                                 " stream: " + std::to_string(channels) +
                                 " channels at " +
                                 std::to_string(sample_rate) + " Hz");
    }
}

// FLAC via dr_flac
DecodedAudio decode_flac(const uint8_t *data, size_t len) {
    unsigned int channels = 0, sample_rate = 0;
    drflac_uint64 total_frames = 0;
    std::unique_ptr<float, FlacFree> interleaved(
        drflac_open_memory_and_read_pcm_frames_f32(
            data, len, &channels, &sample_rate, &total_frames, nullptr));
    if (!interleaved) {
        throw std::runtime_error("Cannot decode FLAC from memory buffer");
    }
    check_stream_shape(AudioFormat::FLAC, static_cast<int>(channels),
                       static_cast<int>(sample_rate));

    auto mono = downmix_to_mono(interleaved.get(), total_frames * channels,
                                static_cast<int>(channels));
    return make_decoded_audio(std::move(mono), static_cast<int>(sample_rate),
                              static_cast<int>(channels), AudioFormat::FLAC);
}

// MP3 via dr_mp3
DecodedAudio decode_mp3(const uint8_t *data, size_t len) {
    drmp3_config info{};
    drmp3_uint64 total_frames = 0;
    std::unique_ptr<float, Mp3Free> interleaved(
        drmp3_open_memory_and_read_pcm_frames_f32(data, len, &info,
                                                  &total_frames, nullptr));
    if (!interleaved) {
        throw std::runtime_error("Cannot decode MP3 from memory buffer");
    }
    int channels = static_cast<int>(info.channels);
    int sample_rate = static_cast<int>(info.sampleRate);
    check_stream_shape(AudioFormat::MP3, channels, sample_rate);

    auto mono =
        downmix_to_mono(interleaved.get(), total_frames * channels, channels);
    return make_decoded_audio(std::move(mono), sample_rate, channels,
                              AudioFormat::MP3);
}

// OGG Vorbis via stb_vorbis (16-bit output)
DecodedAudio decode_ogg(const uint8_t *data, size_t len) {
    if (len > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("OGG payload too large: " +
                                std::to_string(len) + " bytes");
    }
    int channels = 0, sample_rate = 0;
    short *raw = nullptr;
    int frames = stb_vorbis_decode_memory(data, static_cast<int>(len),
                                          &channels, &sample_rate, &raw);
    std::unique_ptr<short, CFree> pcm(raw);
    if (frames < 0 || !pcm) {
        throw std::runtime_error("Cannot decode OGG from memory buffer");
    }
    check_stream_shape(AudioFormat::OGG, channels, sample_rate);

    size_t total = static_cast<size_t>(frames) * channels;
    std::vector<float> interleaved(total);
    for (size_t i = 0; i < total; ++i) {
        interleaved[i] = static_cast<float>(pcm.get()[i]) / 32768.0f;
    }

    auto mono =
        downmix_to_mono(interleaved.data(), interleaved.size(), channels);
    return make_decoded_audio(std::move(mono), sample_rate, channels,
                              AudioFormat::OGG);
}

} // namespace

// ─── Memory Buffer: Encoded Bytes ────────────────────────────────────────────

DecodedAudio decode_audio(const uint8_t *data, size_t len, AudioFormat fmt) {
    if (len == 0) {
        throw EmptyPayloadError("Audio payload is empty");
    }

    switch (fmt) {
    case AudioFormat::WAV:
        return decode_wav(data, len);
    case AudioFormat::FLAC:
        return decode_flac(data, len);
    case AudioFormat::MP3:
        return decode_mp3(data, len);
    case AudioFormat::OGG:
        return decode_ogg(data, len);
    default:
        throw UnsupportedFormatError(
            std::string("No container decoder for format: ") +
            format_name(fmt));
    }
}

DecodedAudio decode_audio(const uint8_t *data, size_t len) {
    if (len == 0) {
        throw EmptyPayloadError("Audio payload is empty");
    }
    auto fmt = detect_format_by_magic(data, len);
    if (fmt == AudioFormat::Unknown) {
        throw UnsupportedFormatError(
            "Unsupported or unrecognized audio format in memory buffer");
    }
    return decode_audio(data, len, fmt);
}

} // namespace ttswav
