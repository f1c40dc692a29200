#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Format descriptor reported with every finished utterance
struct AudioEncoding {
    std::string mimeType;
    unsigned int sampleRate = 0;
    unsigned int channels = 1;
};

class EncoderException : public std::runtime_error {
public:
    explicit EncoderException(const std::string& message) : std::runtime_error(message) {}
};

// Streaming encoder owned by the recorder for the length of one recording.
// Begin() starts a fresh stream, Append() is fed every captured buffer, Finalize() returns the
// encoded payload (empty when nothing was captured) and Discard() drops everything buffered.
class IAudioEncoder {
public:
    virtual ~IAudioEncoder() = default;

    virtual void Begin(unsigned int sampleRate, unsigned int channels) = 0;
    virtual void Append(const int16_t* samples, size_t numSamples) = 0;
    virtual std::vector<uint8_t> Finalize() = 0;
    virtual void Discard() = 0;

    virtual size_t GetSampleCount() const = 0;
    virtual AudioEncoding GetEncoding() const = 0;
};
