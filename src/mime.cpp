#include "ttswav/mime.hpp"

#include <cctype>

namespace ttswav {

namespace {

std::string to_lower(const std::string &s) {
    std::string out = s;
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Largest rate we accept from a MIME parameter (384 kHz)
constexpr long MAX_DECLARED_RATE = 384000;

// First "rate=<digits>" parameter, or -1
long find_rate_param(const std::string &lower) {
    size_t pos = 0;
    while ((pos = lower.find("rate=", pos)) != std::string::npos) {
        // Must start a parameter, not end e.g. "samplerate="
        bool at_boundary =
            pos == 0 || lower[pos - 1] == ';' || lower[pos - 1] == ' ';
        size_t start = pos + 5;
        size_t end = start;
        long value = 0;
        while (end < lower.size() &&
               std::isdigit(static_cast<unsigned char>(lower[end]))) {
            value = value * 10 + (lower[end] - '0');
            if (value > MAX_DECLARED_RATE)
                break;
            ++end;
        }
        if (at_boundary && end > start)
            return value;
        pos = start;
    }
    return -1;
}

} // namespace

AudioFormat detect_format_by_mime(const std::string &mime) {
    std::string m = to_lower(mime);

    if (m.find("l16") != std::string::npos ||
        m.find("pcm") != std::string::npos)
        return AudioFormat::PCM16;

    // Strip parameters: "audio/wav; codecs=1" -> "audio/wav"
    auto semi = m.find(';');
    std::string type = m.substr(0, semi);
    while (!type.empty() && type.back() == ' ')
        type.pop_back();

    if (type == "audio/wav" || type == "audio/x-wav" || type == "audio/wave" ||
        type == "audio/vnd.wave")
        return AudioFormat::WAV;
    if (type == "audio/flac" || type == "audio/x-flac")
        return AudioFormat::FLAC;
    if (type == "audio/mpeg" || type == "audio/mp3")
        return AudioFormat::MP3;
    if (type == "audio/ogg" || type == "audio/vorbis")
        return AudioFormat::OGG;
    return AudioFormat::Unknown;
}

MimeInfo parse_mime_type(const std::string &mime, int default_rate) {
    if (mime.empty())
        return MimeInfo{AudioFormat::PCM16, default_rate, false};

    MimeInfo info{detect_format_by_mime(mime), default_rate, false};

    long rate = find_rate_param(to_lower(mime));
    if (rate > 0 && rate <= MAX_DECLARED_RATE) {
        info.sample_rate = static_cast<int>(rate);
        info.rate_declared = true;
    }
    return info;
}

} // namespace ttswav
