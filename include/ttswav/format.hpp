#pragma once

#include <cstddef>
#include <cstdint>

namespace ttswav {

enum class AudioFormat { Unknown, PCM16, WAV, FLAC, MP3, OGG };

// Format detection from leading bytes. Never returns PCM16: headerless
// PCM has no signature.
AudioFormat detect_format_by_magic(const uint8_t *data, size_t len);

const char *format_name(AudioFormat fmt);

} // namespace ttswav
