#pragma once

#include <vector>
#include <cstdint>
#include <memory>

struct DenoiseState;

struct DenoiseDeleter {
    void operator()(DenoiseState* ptr) const noexcept;
};

// rnnoise front end for captured speech. rnnoise works on 480-sample frames at 48 kHz, so input is
// resampled up, denoised frame by frame and resampled back to the capture rate. Samples that do not
// fill a frame yet stay buffered until the next call.
class NoiseSuppressor {
public:
    static constexpr unsigned int kModelSampleRate = 48000;
    static constexpr size_t kFrameSize = 480;

    NoiseSuppressor();
    ~NoiseSuppressor();

    void SetEnabled(bool enabled);
    bool IsEnabled() const { return _enabled; }

    // Starts a new stream at the capture sample rate and drops any partial frame
    void Reset(unsigned int sampleRate);

    std::vector<int16_t> Process(const int16_t* samples, size_t numSamples);

private:
    static std::vector<float> Resample(const std::vector<float>& input,
                                       unsigned int inputRate, unsigned int outputRate);

    std::unique_ptr<DenoiseState, DenoiseDeleter> _denoiseState;
    bool _enabled = false;
    unsigned int _sampleRate = kModelSampleRate;
    std::vector<float> _pending;
};
