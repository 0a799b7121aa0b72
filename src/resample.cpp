#include "ttswav/resample.hpp"
#include "ttswav/wav.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace ttswav {

namespace {

void check_rates(int source_rate, int target_rate) {
    if (source_rate <= 0) {
        throw std::invalid_argument("Source sample rate must be positive, got " +
                                    std::to_string(source_rate));
    }
    if (target_rate <= 0) {
        throw std::invalid_argument("Target sample rate must be positive, got " +
                                    std::to_string(target_rate));
    }
}

// Shared interpolation loop. `sample_at(i)` returns source sample i as float.
template <typename SampleAt>
ResampledSignal interpolate(size_t source_count, int source_rate,
                            int target_rate, SampleAt sample_at) {
    double ratio = static_cast<double>(target_rate) / source_rate;
    size_t target_count =
        resampled_length(source_count, source_rate, target_rate);
    if (target_count > WAV_MAX_FRAMES) {
        throw std::length_error(
            "Resampled signal of " + std::to_string(target_count) +
            " samples exceeds the WAV size limit (" +
            std::to_string(source_count) + " samples at " +
            std::to_string(source_rate) + " Hz -> " +
            std::to_string(target_rate) + " Hz)");
    }

    ResampledSignal out{std::vector<float>(target_count), 0.0f, target_rate};

    for (size_t i = 0; i < target_count; ++i) {
        double pos = static_cast<double>(i) / ratio;
        size_t idx = static_cast<size_t>(std::floor(pos));
        if (idx >= source_count)
            idx = source_count - 1;
        double frac = pos - static_cast<double>(idx);

        float s1 = sample_at(idx);
        float s2 = idx + 1 < source_count ? sample_at(idx + 1) : s1;

        float sample = static_cast<float>(s1 + (s2 - s1) * frac);
        float mag = std::abs(sample);
        if (mag > out.peak)
            out.peak = mag;
        out.samples[i] = sample;
    }

    return out;
}

} // namespace

size_t resampled_length(size_t source_count, int source_rate,
                        int target_rate) {
    check_rates(source_rate, target_rate);
    // Integer math keeps floor() exact for 24k -> 48k and friends
    return static_cast<size_t>(static_cast<uint64_t>(source_count) *
                               static_cast<uint64_t>(target_rate) /
                               static_cast<uint64_t>(source_rate));
}

ResampledSignal resample_linear(const uint8_t *data, size_t len,
                                ByteOrder order, int source_rate,
                                int target_rate) {
    check_rates(source_rate, target_rate);
    size_t source_count = len / 2; // odd trailing byte ignored
    return interpolate(source_count, source_rate, target_rate,
                       [data, order](size_t i) {
                           return static_cast<float>(
                                      read_pcm16(data, i, order)) /
                                  32768.0f;
                       });
}

ResampledSignal resample_linear(const std::vector<float> &samples,
                                int source_rate, int target_rate) {
    check_rates(source_rate, target_rate);
    const float *src = samples.data();
    return interpolate(samples.size(), source_rate, target_rate,
                       [src](size_t i) { return src[i]; });
}

} // namespace ttswav
