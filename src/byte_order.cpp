#include "ttswav/byte_order.hpp"

#include <cstdlib>

namespace ttswav {

ByteOrderScan resolve_byte_order(const uint8_t *data, size_t len,
                                 const ByteOrderConfig &config) {
    ByteOrderScan scan;
    size_t num_samples = len / 2;

    double sum_le = 0.0;
    double sum_be = 0.0;

    for (size_t i = 0;
         i < num_samples && scan.scanned < config.max_scan_samples; ++i) {
        // Both bytes zero: digital silence, says nothing about order
        if (data[i * 2] == 0 && data[i * 2 + 1] == 0)
            continue;
        sum_le += std::abs(static_cast<int>(
            read_pcm16(data, i, ByteOrder::LittleEndian)));
        sum_be += std::abs(
            static_cast<int>(read_pcm16(data, i, ByteOrder::BigEndian)));
        ++scan.scanned;
    }

    if (scan.scanned == 0)
        return scan;

    scan.mav_le = sum_le / static_cast<double>(scan.scanned);
    scan.mav_be = sum_be / static_cast<double>(scan.scanned);

    // Too few samples to trust the statistics
    if (scan.scanned < config.min_scan_samples)
        return scan;

    if (scan.mav_be > scan.mav_le * config.dominance_ratio) {
        scan.order = ByteOrder::LittleEndian;
        scan.decisive = true;
    } else if (scan.mav_le > scan.mav_be * config.dominance_ratio) {
        scan.order = ByteOrder::BigEndian;
        scan.decisive = true;
    }
    return scan;
}

std::vector<float> decode_pcm16(const uint8_t *data, size_t len,
                                ByteOrder order) {
    size_t n = len / 2;
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<float>(read_pcm16(data, i, order)) / 32768.0f;
    }
    return out;
}

const char *byte_order_name(ByteOrder order) {
    return order == ByteOrder::LittleEndian ? "little-endian" : "big-endian";
}

} // namespace ttswav
