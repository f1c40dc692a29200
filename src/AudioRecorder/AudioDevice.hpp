#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "CaptureError.hpp"

// Called from the device's audio thread: (samples, numSamples, sampleRate)
using DeviceBufferCallback = std::function<void(const int16_t*, size_t, unsigned int)>;
// Called from the device's audio thread when the stream fails after it was started
using DeviceErrorCallback = std::function<void(const std::string&)>;

struct DeviceCallbacks {
    DeviceBufferCallback onBuffer;
    DeviceErrorCallback onError;
};

// An exclusively owned, opened input stream. Destroying it releases the device.
class IAudioDevice {
public:
    virtual ~IAudioDevice() = default;

    // Begins delivering buffers. Throws CaptureError if the stream cannot start.
    virtual void Start() = 0;
    // Stops the stream and releases the device; no callback runs after it returns. Idempotent.
    virtual void Close() = 0;

    virtual unsigned int GetSampleRate() const = 0;
    virtual unsigned int GetChannels() const = 0;
    virtual std::string GetName() const = 0;
};

using AudioDevicePtr = std::unique_ptr<IAudioDevice>;

struct AcquireResult {
    AudioDevicePtr device;
    CaptureErrorKind errorKind = CaptureErrorKind::DeviceUnavailable;
    std::string errorMessage;

    bool Succeeded() const { return device != nullptr; }
};

using AcquireCompletion = std::function<void(AcquireResult)>;

// Source of input devices. Acquire() is asynchronous: the completion always runs later on the
// scheduler thread, never inside the Acquire() call itself.
class IAudioDeviceProvider {
public:
    virtual ~IAudioDeviceProvider() = default;

    virtual void Acquire(DeviceCallbacks callbacks, AcquireCompletion completion) = 0;
};
