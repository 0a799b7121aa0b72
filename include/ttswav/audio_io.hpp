#pragma once

#include <cstdint>
#include <vector>

#include <axiom/axiom.hpp>

#include "ttswav/format.hpp"

namespace ttswav {

struct DecodedAudio {
    axiom::Tensor samples;  // float32, (num_samples,), mono, [-1,1]
    int sample_rate;        // native rate of the container, not resampled
    int num_channels;       // original channel count before downmix
    int num_samples;        // = samples.shape()[0]
    float duration;         // seconds
    AudioFormat format;
};

// Memory buffer: encoded bytes (WAV/FLAC/MP3/OGG detected by magic).
// Throws UnsupportedFormatError when no container signature matches.
DecodedAudio decode_audio(const uint8_t *data, size_t len);

// Same, but trusts the caller's format instead of sniffing.
DecodedAudio decode_audio(const uint8_t *data, size_t len, AudioFormat fmt);

// Copy a 1-D float32 tensor into a plain vector for the pipeline stages.
std::vector<float> to_vector(const axiom::Tensor &samples);

} // namespace ttswav
