#pragma once

#include <cstdint>
#include <vector>

#include "ttswav/byte_order.hpp"

namespace ttswav {

struct ResampledSignal {
    std::vector<float> samples;
    float peak;       // max |sample| before any gain
    int sample_rate;
};

// Linear-interpolation resampler straight from 16-bit PCM bytes.
// Output length is floor(n * target_rate / source_rate); the neighbour of
// the last source sample is the sample itself. Linear (not sinc) is enough
// for integer-ratio upsampling of speech.
// Throws std::invalid_argument for non-positive rates and std::length_error,
// before allocating, when the output would not fit a WAV (WAV_MAX_FRAMES).
ResampledSignal resample_linear(const uint8_t *data, size_t len,
                                ByteOrder order, int source_rate,
                                int target_rate = 48000);

// Same interpolation over already decoded samples.
ResampledSignal resample_linear(const std::vector<float> &samples,
                                int source_rate, int target_rate = 48000);

// floor(source_count * target_rate / source_rate)
size_t resampled_length(size_t source_count, int source_rate,
                        int target_rate);

} // namespace ttswav
