#pragma once

#include <cstddef>

namespace ttswav {

// ─── Byte Order Scan Config ─────────────────────────────────────────────────

struct ByteOrderConfig {
    size_t max_scan_samples = 5000; // non-silent positions inspected at most
    size_t min_scan_samples = 64;   // below this the scan is not trusted
    double dominance_ratio = 1.5;   // MAV margin needed to flip the default
};

// ─── Gain / Envelope Config ─────────────────────────────────────────────────

struct GainConfig {
    float peak_ceiling = 0.6f;  // ~-4.4 dBFS
    double fade_seconds = 0.005;
    int max_fade_samples = 120;
};

// ─── Pipeline Config ────────────────────────────────────────────────────────

struct PipelineConfig {
    int default_source_rate = 24000; // assumed when no rate hint is present
    int target_rate = 48000;
    ByteOrderConfig byte_order;
    GainConfig gain;
};

// ─── Presets ────────────────────────────────────────────────────────────────

// 24 kHz L16 speech in, 48 kHz stereo WAV out, 60% peak ceiling
inline PipelineConfig make_speech_config() {
    PipelineConfig cfg;
    cfg.default_source_rate = 24000;
    cfg.target_rate = 48000;
    cfg.byte_order.max_scan_samples = 5000;
    cfg.byte_order.min_scan_samples = 64;
    cfg.byte_order.dominance_ratio = 1.5;
    cfg.gain.peak_ceiling = 0.6f;
    cfg.gain.fade_seconds = 0.005;
    cfg.gain.max_fade_samples = 120;
    return cfg;
}

} // namespace ttswav
