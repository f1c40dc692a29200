#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

// Short-window loudness meter with sustained-silence detection.
//
// Samples are cut into fixed windows; every full window is one analysis tick producing the
// window RMS in dB (clamped to [-100, 0]). Once the grace period has elapsed, the first tick
// below the threshold starts the silence timer, any tick above it clears the timer, and when the
// timer exceeds the configured duration the silence event fires. It fires at most once until
// Reset() is called for the next recording.
class LevelMeter {
public:
    struct Config {
        unsigned int sampleRate = 16000;
        size_t windowSize = 1024;
        double thresholdDb = -45.0;
        unsigned int silenceMs = 1200;
        unsigned int graceMs = 250;
    };

    using LevelCallback = std::function<void(double levelDb)>;

    static constexpr double kMinLevelDb = -100.0;
    static constexpr double kMaxLevelDb = 0.0;

    // Throws std::invalid_argument when the configuration cannot be analyzed
    explicit LevelMeter(Config config);

    // Returns true on the tick the silence event fires
    bool Feed(const int16_t* samples, size_t numSamples);
    void Reset();

    void SetOnLevelCallback(LevelCallback cb) { _onLevel = std::move(cb); }

    double GetLevelDb() const { return _levelDb; }
    bool HasSilenceFired() const { return _silenceFired; }
    double GetElapsedMs() const;

    static double ComputeLevelDb(const float* window, size_t count);

private:
    bool Tick();

    Config _config;
    LevelCallback _onLevel;

    std::vector<float> _window;
    uint64_t _samplesAnalyzed = 0;
    double _levelDb = kMinLevelDb;
    bool _silenceTiming = false;
    double _silenceStartMs = 0.0;
    bool _silenceFired = false;
};
