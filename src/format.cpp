#include "ttswav/format.hpp"

namespace ttswav {

// ─── Format Detection ────────────────────────────────────────────────────────

AudioFormat detect_format_by_magic(const uint8_t *data, size_t len) {
    if (len < 2)
        return AudioFormat::Unknown;

    // MP3: frame sync (11 set bits)
    if (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) {
        return AudioFormat::MP3;
    }

    // MP3: ID3 tag
    if (len >= 3 && data[0] == 'I' && data[1] == 'D' && data[2] == '3') {
        return AudioFormat::MP3;
    }

    if (len < 4)
        return AudioFormat::Unknown;

    // RIFF....WAVE
    if (len >= 12 && data[0] == 'R' && data[1] == 'I' && data[2] == 'F' &&
        data[3] == 'F' && data[8] == 'W' && data[9] == 'A' &&
        data[10] == 'V' && data[11] == 'E') {
        return AudioFormat::WAV;
    }

    // fLaC
    if (data[0] == 'f' && data[1] == 'L' && data[2] == 'a' &&
        data[3] == 'C') {
        return AudioFormat::FLAC;
    }

    // OggS
    if (data[0] == 'O' && data[1] == 'g' && data[2] == 'g' &&
        data[3] == 'S') {
        return AudioFormat::OGG;
    }

    return AudioFormat::Unknown;
}

const char *format_name(AudioFormat fmt) {
    switch (fmt) {
    case AudioFormat::PCM16:
        return "pcm16";
    case AudioFormat::WAV:
        return "wav";
    case AudioFormat::FLAC:
        return "flac";
    case AudioFormat::MP3:
        return "mp3";
    case AudioFormat::OGG:
        return "ogg";
    default:
        return "unknown";
    }
}

} // namespace ttswav
