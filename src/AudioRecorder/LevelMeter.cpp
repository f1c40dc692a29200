#include "LevelMeter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

constexpr double kEpsilon = 1e-10;

} // namespace

LevelMeter::LevelMeter(Config config) : _config(config) {
    if (_config.sampleRate == 0) {
        throw std::invalid_argument("LevelMeter: sample rate must be positive");
    }
    if (_config.windowSize == 0) {
        throw std::invalid_argument("LevelMeter: window size must be positive");
    }
    if (_config.thresholdDb > kMaxLevelDb || _config.thresholdDb < kMinLevelDb) {
        throw std::invalid_argument("LevelMeter: threshold " + std::to_string(_config.thresholdDb) +
                                    " dB is outside [-100, 0]");
    }
    _window.reserve(_config.windowSize);
}

void LevelMeter::Reset() {
    _window.clear();
    _samplesAnalyzed = 0;
    _levelDb = kMinLevelDb;
    _silenceTiming = false;
    _silenceStartMs = 0.0;
    _silenceFired = false;
}

double LevelMeter::GetElapsedMs() const {
    return 1000.0 * static_cast<double>(_samplesAnalyzed) / _config.sampleRate;
}

double LevelMeter::ComputeLevelDb(const float* window, size_t count) {
    double acc = 0.0;
    for (size_t i = 0; i < count; ++i) {
        acc += static_cast<double>(window[i]) * window[i];
    }
    acc /= std::max<size_t>(1, count);
    const double db = 20.0 * std::log10(std::sqrt(acc) + kEpsilon);
    return std::max(kMinLevelDb, std::min(kMaxLevelDb, db));
}

bool LevelMeter::Feed(const int16_t* samples, size_t numSamples) {
    if (!samples || numSamples == 0) {
        return false;
    }

    bool fired = false;
    for (size_t i = 0; i < numSamples; ++i) {
        _window.push_back(static_cast<float>(samples[i]) / 32768.0f);
        if (_window.size() == _config.windowSize) {
            fired = Tick() || fired;
            _window.clear();
        }
    }
    return fired;
}

bool LevelMeter::Tick() {
    const double windowStartMs = GetElapsedMs();
    _samplesAnalyzed += _window.size();
    const double tickMs = GetElapsedMs();

    _levelDb = ComputeLevelDb(_window.data(), _window.size());
    if (_onLevel) {
        _onLevel(_levelDb);
    }

    if (_silenceFired) {
        return false;
    }

    if (_levelDb >= _config.thresholdDb) {
        _silenceTiming = false;
        return false;
    }

    if (tickMs < _config.graceMs) {
        return false;
    }

    if (!_silenceTiming) {
        // Silence cannot be counted from before the grace period
        _silenceTiming = true;
        _silenceStartMs = std::max(windowStartMs, static_cast<double>(_config.graceMs));
    }

    if (tickMs - _silenceStartMs > _config.silenceMs) {
        _silenceFired = true;
        return true;
    }
    return false;
}
