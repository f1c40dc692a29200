#include "NoiseSuppressor.hpp"
#include "rnnoise.h"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cmath>

void DenoiseDeleter::operator()(DenoiseState* ptr) const noexcept {
    if (ptr) {
        rnnoise_destroy(ptr);
    }
}

NoiseSuppressor::NoiseSuppressor()
    : _denoiseState(rnnoise_create(nullptr)) {
    if (!_denoiseState) {
        ERROR_LOG("NoiseSuppressor: rnnoise_create failed, suppression disabled");
    }
    _pending.reserve(kFrameSize * 4);
}

NoiseSuppressor::~NoiseSuppressor() = default;

void NoiseSuppressor::SetEnabled(bool enabled) {
    _enabled = enabled && _denoiseState != nullptr;
    _pending.clear();
}

void NoiseSuppressor::Reset(unsigned int sampleRate) {
    _sampleRate = sampleRate ? sampleRate : kModelSampleRate;
    _pending.clear();
    // A fresh state keeps the previous recording's noise estimate out of this one
    _denoiseState.reset(rnnoise_create(nullptr));
    if (!_denoiseState) {
        _enabled = false;
    }
}

std::vector<float> NoiseSuppressor::Resample(const std::vector<float>& input,
                                             unsigned int inputRate, unsigned int outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    const size_t outputSamples = static_cast<size_t>(std::round(input.size() * ratio));
    std::vector<float> output(outputSamples);

    for (size_t i = 0; i < outputSamples; ++i) {
        const double position = i / ratio;
        const size_t left = std::min(static_cast<size_t>(position), input.size() - 1);
        const size_t right = std::min(left + 1, input.size() - 1);
        const double t = position - static_cast<double>(left);
        output[i] = static_cast<float>(input[left] * (1.0 - t) + input[right] * t);
    }
    return output;
}

std::vector<int16_t> NoiseSuppressor::Process(const int16_t* samples, size_t numSamples) {
    if (!samples || numSamples == 0) {
        return {};
    }
    if (!_enabled) {
        return std::vector<int16_t>(samples, samples + numSamples);
    }

    // rnnoise expects float samples in the int16 range
    std::vector<float> input(samples, samples + numSamples);
    std::vector<float> upsampled = Resample(input, _sampleRate, kModelSampleRate);
    _pending.insert(_pending.end(), upsampled.begin(), upsampled.end());

    std::vector<float> denoised;
    size_t offset = 0;
    while (_pending.size() - offset >= kFrameSize) {
        float frame[kFrameSize];
        std::copy(_pending.begin() + offset, _pending.begin() + offset + kFrameSize, frame);
        rnnoise_process_frame(_denoiseState.get(), frame, frame);
        denoised.insert(denoised.end(), frame, frame + kFrameSize);
        offset += kFrameSize;
    }
    _pending.erase(_pending.begin(), _pending.begin() + offset);

    if (denoised.empty()) {
        return {};
    }

    std::vector<float> output = Resample(denoised, kModelSampleRate, _sampleRate);
    std::vector<int16_t> result(output.size());
    for (size_t i = 0; i < output.size(); ++i) {
        const float clamped = std::max(-32768.0f, std::min(32767.0f, output[i]));
        result[i] = static_cast<int16_t>(clamped);
    }
    return result;
}
