#include "Config/TrainerConfig.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

TEST(TrainerConfigTest, DefaultsMatchCaptureContract) {
    TrainerConfig config;
    EXPECT_DOUBLE_EQ(config.recorder.vad.thresholdDb, -45.0);
    EXPECT_EQ(config.recorder.vad.silenceMs, 1200u);
    EXPECT_EQ(config.recorder.vad.graceMs, 250u);
    EXPECT_EQ(config.recorder.vad.windowSize, 1024u);
    EXPECT_EQ(config.recorder.maxRecordingMs, 60000u);
    EXPECT_TRUE(config.recorder.vadEnabled);
    EXPECT_NO_THROW(ValidateConfig(config));
    EXPECT_TRUE(MakeCaptureContext(config).secure);
}

TEST(TrainerConfigTest, JsonOverridesOnlyPresentFields) {
    TrainerConfig config;
    ApplyConfigJson(config, json::parse(R"({
        "backend_url": "ws://localhost:9000/ws",
        "session": {"role": "analyst"},
        "vad": {"threshold_db": -50, "silence_ms": 800},
        "recorder": {"noise_suppression": false, "max_recording_ms": 30000},
        "playback": {"enabled": false},
        "something_else": 1
    })"));

    EXPECT_EQ(config.backendUrl, "ws://localhost:9000/ws");
    EXPECT_EQ(config.session.role, "analyst");
    EXPECT_EQ(config.session.level, "senior");
    EXPECT_DOUBLE_EQ(config.recorder.vad.thresholdDb, -50.0);
    EXPECT_EQ(config.recorder.vad.silenceMs, 800u);
    EXPECT_EQ(config.recorder.vad.graceMs, 250u);
    EXPECT_FALSE(config.recorder.noiseSuppression);
    EXPECT_EQ(config.recorder.maxRecordingMs, 30000u);
    EXPECT_FALSE(config.playbackEnabled);
}

TEST(TrainerConfigTest, RejectsBadValues) {
    TrainerConfig config;
    EXPECT_THROW(ApplyConfigJson(config, json{{"vad", {{"threshold_db", 6}}}}), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json{{"vad", {{"silence_ms", "long"}}}}), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json{{"backend_url", "http://example.com"}}), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json{{"vad", 5}}), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json{{"recorder", {{"input_device", 3}}}}), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json::array()), std::invalid_argument);
}

TEST(TrainerConfigTest, LoadsFileAndReportsErrors) {
    const std::string path = ::testing::TempDir() + "speaktrainer_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"backend_url": "ws://trainer.example.com/ws", "warm_up": false})";
    }
    const TrainerConfig config = LoadTrainerConfig(path);
    EXPECT_EQ(config.backendUrl, "ws://trainer.example.com/ws");
    EXPECT_FALSE(config.warmUp);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(LoadTrainerConfig(path), std::invalid_argument);
    std::remove(path.c_str());

    EXPECT_THROW(LoadTrainerConfig(path + ".missing"), std::runtime_error);
}

TEST(TrainerConfigTest, EnvironmentOverridesBackendUrl) {
    TrainerConfig config;
    setenv(kBackendUrlEnv, "ws://127.0.0.1:7000/ws", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.backendUrl, "ws://127.0.0.1:7000/ws");

    setenv(kBackendUrlEnv, "", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.backendUrl, "ws://127.0.0.1:7000/ws") << "Empty value is ignored";
    unsetenv(kBackendUrlEnv);
}

TEST(TrainerConfigTest, SecureEndpointRules) {
    EXPECT_TRUE(IsSecureEndpoint("wss://trainer.example.com/ws"));
    EXPECT_TRUE(IsSecureEndpoint("https://trainer.example.com"));
    EXPECT_TRUE(IsSecureEndpoint("ws://localhost:8000/ws"));
    EXPECT_TRUE(IsSecureEndpoint("ws://127.0.0.1/ws"));
    EXPECT_TRUE(IsSecureEndpoint("ws://[::1]:8000/ws"));
    EXPECT_TRUE(IsSecureEndpoint("WS://LOCALHOST:8000"));

    EXPECT_FALSE(IsSecureEndpoint("ws://192.168.1.20:8000/ws"));
    EXPECT_FALSE(IsSecureEndpoint("ws://localhost.example.com/ws"));
    EXPECT_FALSE(IsSecureEndpoint("ws://user@trainer.example.com/ws"));
    EXPECT_FALSE(IsSecureEndpoint("localhost"));
}

TEST(TrainerConfigTest, InsecureRemoteNeedsExplicitOptIn) {
    TrainerConfig config;
    config.backendUrl = "ws://10.0.0.5:8000/ws";

    const CaptureContext blocked = MakeCaptureContext(config);
    EXPECT_FALSE(blocked.secure);
    EXPECT_FALSE(blocked.reason.empty());

    config.allowInsecureRemote = true;
    EXPECT_TRUE(MakeCaptureContext(config).secure);
}

TEST(TrainerConfigTest, EncryptedUrlRejectedWithoutTlsTransport) {
    TrainerConfig config;
    config.backendUrl = "wss://trainer.example.com/ws";
    EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

    config.backendUrl = "WSS://127.0.0.1:8000/ws";
    EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

    config = TrainerConfig{};
    EXPECT_THROW(ApplyConfigJson(config, json{{"backend_url", "wss://trainer.example.com/ws"}}),
                 std::invalid_argument);
}

TEST(TrainerConfigTest, InputDeviceSelection) {
    TrainerConfig config;
    EXPECT_TRUE(config.device.inputDevice.empty()) << "Default input is used unless one is named";

    ApplyConfigJson(config, json::parse(R"({"recorder": {"input_device": "USB Microphone"}})"));
    EXPECT_EQ(config.device.inputDevice, "USB Microphone");
    EXPECT_EQ(config.device.bufferFrames, 256u);

    ApplyConfigJson(config, json::parse(R"({"recorder": {"input_device": "131"}})"));
    EXPECT_EQ(config.device.inputDevice, "131");
}
