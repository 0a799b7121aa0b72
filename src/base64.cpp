#include "ttswav/base64.hpp"

#include "ttswav/errors.hpp"

#include <array>

namespace ttswav {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t INVALID = -1;
constexpr int8_t SKIP = -2;
constexpr int8_t PAD = -3;

// Standard and URL-safe alphabets share one table
std::array<int8_t, 256> build_decode_table() {
    std::array<int8_t, 256> table;
    table.fill(INVALID);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] =
            static_cast<int8_t>(i);
    }
    table['-'] = 62;
    table['_'] = 63;
    table[' '] = SKIP;
    table['\t'] = SKIP;
    table['\r'] = SKIP;
    table['\n'] = SKIP;
    table['='] = PAD;
    return table;
}

const std::array<int8_t, 256> &decode_table() {
    static const std::array<int8_t, 256> table = build_decode_table();
    return table;
}

} // namespace

std::vector<uint8_t> base64_decode(const std::string &text) {
    const auto &table = decode_table();

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3 + 3);

    uint32_t acc = 0;
    int sextets = 0;
    bool padding = false;

    for (size_t i = 0; i < text.size(); ++i) {
        int8_t v = table[static_cast<unsigned char>(text[i])];
        if (v == SKIP)
            continue;
        if (v == PAD) {
            padding = true;
            continue;
        }
        if (v == INVALID) {
            throw Base64Error("Invalid base64 character at offset " +
                              std::to_string(i));
        }
        if (padding) {
            throw Base64Error("Base64 data after '=' padding at offset " +
                              std::to_string(i));
        }

        acc = (acc << 6) | static_cast<uint32_t>(v);
        if (++sextets == 4) {
            out.push_back(static_cast<uint8_t>(acc >> 16));
            out.push_back(static_cast<uint8_t>(acc >> 8));
            out.push_back(static_cast<uint8_t>(acc));
            acc = 0;
            sextets = 0;
        }
    }

    // Tail quantum: 2 sextets -> 1 byte, 3 sextets -> 2 bytes
    switch (sextets) {
    case 0:
        break;
    case 2:
        out.push_back(static_cast<uint8_t>(acc >> 4));
        break;
    case 3:
        out.push_back(static_cast<uint8_t>(acc >> 10));
        out.push_back(static_cast<uint8_t>(acc >> 2));
        break;
    default:
        throw Base64Error("Truncated base64 input (dangling sextet)");
    }

    return out;
}

std::string base64_encode(const uint8_t *data, size_t len) {
    std::string out;
    out.reserve((len + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += ALPHABET[n & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

} // namespace ttswav
