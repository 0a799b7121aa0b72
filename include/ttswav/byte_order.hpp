#pragma once

#include <cstdint>
#include <vector>

#include "ttswav/config.hpp"

namespace ttswav {

enum class ByteOrder { LittleEndian, BigEndian };

struct ByteOrderScan {
    ByteOrder order = ByteOrder::LittleEndian;
    double mav_le = 0.0;   // mean |int16| read little-endian
    double mav_be = 0.0;   // mean |int16| read big-endian
    size_t scanned = 0;    // non-silent positions that contributed
    bool decisive = false; // false when the default was used
};

// Guess the byte order of headerless 16-bit PCM.
//
// A wrong interpretation of speech swaps high and low bytes, which turns a
// smooth waveform into large noise-like values, so the orientation with the
// lower mean absolute value wins when it is lower by the dominance ratio.
// Positions whose two bytes are both zero are skipped. Ambiguous or too
// short scans fall back to little-endian.
ByteOrderScan resolve_byte_order(const uint8_t *data, size_t len,
                                 const ByteOrderConfig &config = {});

inline ByteOrderScan resolve_byte_order(const std::vector<uint8_t> &bytes,
                                        const ByteOrderConfig &config = {}) {
    return resolve_byte_order(bytes.data(), bytes.size(), config);
}

// Read sample `index` as int16 in the given order.
inline int16_t read_pcm16(const uint8_t *data, size_t index, ByteOrder order) {
    uint8_t b0 = data[index * 2];
    uint8_t b1 = data[index * 2 + 1];
    uint16_t u = order == ByteOrder::LittleEndian
                     ? static_cast<uint16_t>(b0 | (b1 << 8))
                     : static_cast<uint16_t>((b0 << 8) | b1);
    return static_cast<int16_t>(u);
}

// int16 / 32768 for every complete sample; an odd trailing byte is dropped.
std::vector<float> decode_pcm16(const uint8_t *data, size_t len,
                                ByteOrder order);

const char *byte_order_name(ByteOrder order);

} // namespace ttswav
