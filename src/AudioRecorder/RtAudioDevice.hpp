#pragma once

#include <RtAudio.h>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "AudioDevice.hpp"

struct CaptureDeviceConfig {
    unsigned int preferredSampleRate = 48000;
    unsigned int bufferFrames = 256;
    // Device name or numeric RtAudio id; empty selects the default input
    std::string inputDevice;
};

// Microphone input stream opened through RtAudio
class RtAudioDevice : public IAudioDevice {
public:
    RtAudioDevice(const CaptureDeviceConfig& config, DeviceCallbacks callbacks);
    ~RtAudioDevice() override;

    RtAudioDevice(const RtAudioDevice&) = delete;
    RtAudioDevice& operator=(const RtAudioDevice&) = delete;

    void Start() override;
    void Close() override;

    unsigned int GetSampleRate() const override { return _sampleRate; }
    unsigned int GetChannels() const override { return 1; }
    std::string GetName() const override { return _name; }

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    unsigned int SelectInputDevice(const std::string& requested);
    void OpenStream(unsigned int deviceId, unsigned int preferredRate, unsigned int bufferFrames);
    void OnStreamError(RtAudioErrorType type, const std::string& errorText);

    std::unique_ptr<RtAudio> _audio;
    DeviceCallbacks _callbacks;
    std::string _name;
    unsigned int _sampleRate = 0;
    std::atomic<bool> _delivering{false};
    std::mutex _closeMutex;
    std::string _lastError;
};

// Opens RtAudio input devices and reports the result on the scheduler
class RtAudioDeviceProvider : public IAudioDeviceProvider {
public:
    RtAudioDeviceProvider(boost::asio::io_context& io, CaptureDeviceConfig config);

    void Acquire(DeviceCallbacks callbacks, AcquireCompletion completion) override;

private:
    boost::asio::io_context& _io;
    CaptureDeviceConfig _config;
};
