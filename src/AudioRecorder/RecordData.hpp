#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "../Encoding/IAudioEncoder.hpp"

enum class RecorderState {
    Idle,
    Acquiring,
    Recording,
    Stopping,
    Cancelling,
    Error
};

inline const char* GetRecorderStateName(RecorderState state) {
    switch (state) {
        case RecorderState::Idle:       return "Idle";
        case RecorderState::Acquiring:  return "Acquiring";
        case RecorderState::Recording:  return "Recording";
        case RecorderState::Stopping:   return "Stopping";
        case RecorderState::Cancelling: return "Cancelling";
        case RecorderState::Error:      return "Error";
    }
    return "Invalid";
}

enum class PermissionState {
    Unknown,
    Granted,
    Denied
};

// One capture attempt. Every asynchronous event carries the token it was issued under.
struct RecordingSession {
    uint64_t token = 0;
    std::chrono::steady_clock::time_point startedAt;
    AudioEncoding encoding;
};

// A finished, encoded recording. Never delivered when empty or when its token is stale.
struct Utterance {
    uint64_t token = 0;
    std::vector<uint8_t> data;
    AudioEncoding encoding;
    size_t sampleCount = 0;
    double durationSeconds = 0.0;

    bool IsEmpty() const { return data.empty() || sampleCount == 0; }
};
