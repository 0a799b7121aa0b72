#pragma once

#include <vector>

#include "ttswav/config.hpp"

namespace ttswav {

struct GainPlan {
    float gain;        // scalar applied to every sample
    int fade_samples;  // linear ramp length at each end
    bool clamped;      // true when the ceiling overrode the volume
};

// Pick the gain for a signal with the given peak.
//   peak * volume >  ceiling  ->  gain = ceiling / peak
//   otherwise                 ->  gain = volume (never amplified past ceiling)
// A silent signal (peak == 0) keeps gain = volume.
// fade_samples = min(floor(sample_rate * fade_seconds), max_fade_samples).
// Throws std::invalid_argument if volume is negative or not finite.
GainPlan compute_gain_plan(float peak, int sample_rate, float volume = 1.0f,
                           const GainConfig &config = {});

// Scale by plan.gain and apply the fade-in / fade-out envelope.
std::vector<float> apply_gain(const std::vector<float> &samples,
                              const GainPlan &plan);

// In-place variant used by the pipeline.
void apply_gain_inplace(std::vector<float> &samples, const GainPlan &plan);

} // namespace ttswav
