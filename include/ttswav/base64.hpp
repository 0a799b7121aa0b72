#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ttswav {

// Decode RFC 4648 base64 (standard or URL-safe alphabet).
// Whitespace is skipped and trailing '=' padding is optional.
// Throws Base64Error on any other character or a truncated quantum.
std::vector<uint8_t> base64_decode(const std::string &text);

// Encode with the standard alphabet, padded.
std::string base64_encode(const uint8_t *data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t> &bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

} // namespace ttswav
