#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

#include "../AudioRecorder/AudioRecorder.hpp"
#include "../AudioRecorder/RtAudioDevice.hpp"
#include "../Backend/BackendTypes.hpp"

inline const char* const kBackendUrlEnv = "SPEAKTRAINER_BACKEND_URL";

struct TrainerConfig {
    std::string backendUrl = "ws://127.0.0.1:8000/ws";
    bool allowInsecureRemote = false;
    unsigned int requestTimeoutMs = 30000;

    SessionContext session;
    RecorderConfig recorder;
    CaptureDeviceConfig device;

    bool playbackEnabled = true;
    bool warmUp = true;
};

// Overrides the fields present in `json`; unknown keys are ignored.
// Throws std::invalid_argument on a wrongly typed or out-of-range value.
void ApplyConfigJson(TrainerConfig& config, const nlohmann::json& json);

// Reads a JSON configuration file on top of the defaults. Throws std::runtime_error when the file
// cannot be read and std::invalid_argument when it does not parse or holds bad values.
TrainerConfig LoadTrainerConfig(const std::string& path);

// SPEAKTRAINER_BACKEND_URL replaces the backend URL when set and non-empty
void ApplyEnvironment(TrainerConfig& config);

// Throws std::invalid_argument describing the first bad field
void ValidateConfig(const TrainerConfig& config);

// True for encrypted endpoints (wss, https) and loopback hosts
bool IsSecureEndpoint(const std::string& url);

// Decides whether the microphone may be opened for this configuration
CaptureContext MakeCaptureContext(const TrainerConfig& config);
