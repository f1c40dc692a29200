#pragma once

#include <cstdint>
#include <vector>

struct DecodedAudio {
    std::vector<int16_t> samples;  // interleaved
    unsigned int sampleRate = 0;
    unsigned int channels = 0;

    size_t GetFrameCount() const { return channels ? samples.size() / channels : 0; }
};

// Ten minutes of 48 kHz stereo; longer replies are refused
constexpr int64_t kMaxDecodedSamples = 48000LL * 2 * 600;

// Decodes any container libsndfile understands (the synthesized reply is WAV).
// Throws EncoderException on malformed input.
DecodedAudio DecodeAudio(const std::vector<uint8_t>& encoded);
