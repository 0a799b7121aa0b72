#include "ttswav/normalize.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ttswav {

GainPlan compute_gain_plan(float peak, int sample_rate, float volume,
                           const GainConfig &config) {
    if (!std::isfinite(volume) || volume < 0.0f) {
        throw std::invalid_argument("Volume multiplier must be finite and "
                                    "non-negative, got " +
                                    std::to_string(volume));
    }
    if (sample_rate <= 0) {
        throw std::invalid_argument("Sample rate must be positive, got " +
                                    std::to_string(sample_rate));
    }

    GainPlan plan{volume, 0, false};

    // peak == 0 never reaches the division: 0 * volume is not > ceiling
    if (peak * volume > config.peak_ceiling) {
        plan.gain = config.peak_ceiling / peak;
        plan.clamped = true;
    }

    int fade = static_cast<int>(
        std::floor(static_cast<double>(sample_rate) * config.fade_seconds));
    plan.fade_samples = std::max(0, std::min(fade, config.max_fade_samples));
    return plan;
}

void apply_gain_inplace(std::vector<float> &samples, const GainPlan &plan) {
    size_t n = samples.size();
    size_t fade = static_cast<size_t>(plan.fade_samples);
    float fade_f = static_cast<float>(fade);

    for (size_t i = 0; i < n; ++i) {
        float s = samples[i] * plan.gain;
        if (fade > 0) {
            if (i < fade)
                s *= static_cast<float>(i) / fade_f;
            else if (i + fade > n)
                s *= static_cast<float>(n - i) / fade_f;
        }
        samples[i] = s;
    }
}

std::vector<float> apply_gain(const std::vector<float> &samples,
                              const GainPlan &plan) {
    std::vector<float> out = samples;
    apply_gain_inplace(out, plan);
    return out;
}

} // namespace ttswav
