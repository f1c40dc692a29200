#pragma once

#include "IAudioEncoder.hpp"

// 16-bit PCM WAV encoder backed by libsndfile, written to memory
class WavEncoder : public IAudioEncoder {
public:
    WavEncoder() = default;

    void Begin(unsigned int sampleRate, unsigned int channels) override;
    void Append(const int16_t* samples, size_t numSamples) override;
    std::vector<uint8_t> Finalize() override;
    void Discard() override;

    size_t GetSampleCount() const override { return _audioData.size(); }
    AudioEncoding GetEncoding() const override;

private:
    std::vector<int16_t> _audioData;
    unsigned int _sampleRate = 0;
    unsigned int _channels = 1;
    bool _begun = false;
};
