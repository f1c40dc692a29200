#include "TrainerConfig.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void Read(const json& object, const char* key, T& target) {
    if (!object.contains(key)) return;
    try {
        target = object.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Config field \"") + key + "\": " + e.what());
    }
}

const json& Section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const json& section = root.at(key);
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("Config section \"") + key + "\" must be an object");
    }
    return section;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

void ApplyConfigJson(TrainerConfig& config, const json& root) {
    if (!root.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }

    Read(root, "backend_url", config.backendUrl);
    Read(root, "allow_insecure_remote", config.allowInsecureRemote);
    Read(root, "request_timeout_ms", config.requestTimeoutMs);
    Read(root, "warm_up", config.warmUp);

    const json& session = Section(root, "session");
    Read(session, "role", config.session.role);
    Read(session, "level", config.session.level);
    Read(session, "mode", config.session.mode);

    const json& recorder = Section(root, "recorder");
    Read(recorder, "max_recording_ms", config.recorder.maxRecordingMs);
    Read(recorder, "noise_suppression", config.recorder.noiseSuppression);
    Read(recorder, "preferred_sample_rate", config.device.preferredSampleRate);
    Read(recorder, "buffer_frames", config.device.bufferFrames);
    Read(recorder, "input_device", config.device.inputDevice);

    const json& vad = Section(root, "vad");
    Read(vad, "enabled", config.recorder.vadEnabled);
    Read(vad, "threshold_db", config.recorder.vad.thresholdDb);
    Read(vad, "silence_ms", config.recorder.vad.silenceMs);
    Read(vad, "grace_ms", config.recorder.vad.graceMs);
    Read(vad, "window_size", config.recorder.vad.windowSize);

    const json& playback = Section(root, "playback");
    Read(playback, "enabled", config.playbackEnabled);

    ValidateConfig(config);
}

TrainerConfig LoadTrainerConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Could not open config file " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Config file " + path + " is not valid JSON: " + e.what());
    }

    TrainerConfig config;
    ApplyConfigJson(config, root);
    DEBUG_LOG("Loaded config from " << path << DEBUG_LOG_ENDL);
    return config;
}

void ApplyEnvironment(TrainerConfig& config) {
    const char* url = std::getenv(kBackendUrlEnv);
    if (url && *url) {
        config.backendUrl = url;
    }
}

void ValidateConfig(const TrainerConfig& config) {
    const std::string url = ToLower(config.backendUrl);
    if (url.rfind("wss://", 0) == 0) {
        throw std::invalid_argument("backend_url: wss:// is not supported by this build, use ws://: " + config.backendUrl);
    }
    if (url.rfind("ws://", 0) != 0) {
        throw std::invalid_argument("backend_url must be a ws:// URL: " + config.backendUrl);
    }
    if (config.requestTimeoutMs == 0) {
        throw std::invalid_argument("request_timeout_ms must be positive");
    }
    if (config.device.preferredSampleRate == 0) {
        throw std::invalid_argument("preferred_sample_rate must be positive");
    }
    if (config.device.bufferFrames == 0) {
        throw std::invalid_argument("buffer_frames must be positive");
    }

    const LevelMeter::Config& vad = config.recorder.vad;
    if (vad.thresholdDb < LevelMeter::kMinLevelDb || vad.thresholdDb > LevelMeter::kMaxLevelDb) {
        throw std::invalid_argument("threshold_db must lie in [-100, 0]");
    }
    if (vad.windowSize == 0) {
        throw std::invalid_argument("window_size must be positive");
    }
}

bool IsSecureEndpoint(const std::string& url) {
    const std::string lower = ToLower(url);
    const auto schemeEnd = lower.find("://");
    if (schemeEnd == std::string::npos) {
        return false;
    }

    const std::string scheme = lower.substr(0, schemeEnd);
    if (scheme == "wss" || scheme == "https") {
        return true;
    }

    std::string authority = lower.substr(schemeEnd + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) return false;
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

CaptureContext MakeCaptureContext(const TrainerConfig& config) {
    CaptureContext context;
    if (IsSecureEndpoint(config.backendUrl)) {
        return context;
    }
    if (config.allowInsecureRemote) {
        DEBUG_LOG("Insecure remote backend allowed by configuration: " << config.backendUrl << DEBUG_LOG_ENDL);
        return context;
    }
    context.secure = false;
    context.reason = "Microphone access requires a local backend or allow_insecure_remote (got " + config.backendUrl + ")";
    return context;
}
