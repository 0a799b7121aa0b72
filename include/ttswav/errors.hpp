#pragma once

#include <stdexcept>
#include <string>

namespace ttswav {

// Payload is zero-length or holds no complete 16-bit sample.
class EmptyPayloadError : public std::runtime_error {
  public:
    explicit EmptyPayloadError(const std::string &what)
        : std::runtime_error(what) {}
};

// Transport text is not valid base64.
class Base64Error : public std::runtime_error {
  public:
    explicit Base64Error(const std::string &what)
        : std::runtime_error(what) {}
};

// Encoded payload is neither raw PCM nor a container we can decode.
class UnsupportedFormatError : public std::runtime_error {
  public:
    explicit UnsupportedFormatError(const std::string &what)
        : std::runtime_error(what) {}
};

} // namespace ttswav
