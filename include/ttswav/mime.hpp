#pragma once

#include <string>

#include "ttswav/format.hpp"

namespace ttswav {

struct MimeInfo {
    AudioFormat format;  // PCM16 for L16 / pcm, container type otherwise
    int sample_rate;     // from "rate=NNNN", or the default
    bool rate_declared;  // true when the rate came from the MIME string
};

// Interpret a provider MIME type such as "audio/L16;codec=pcm;rate=24000".
// An empty string is treated as raw PCM at default_rate.
MimeInfo parse_mime_type(const std::string &mime, int default_rate = 24000);

// Container type from the MIME alone (no rate handling).
AudioFormat detect_format_by_mime(const std::string &mime);

} // namespace ttswav
