#include "RtAudioDevice.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace {

CaptureErrorKind ClassifyOpenError(const std::string& text) {
    if (text.find("ermission") != std::string::npos || text.find("denied") != std::string::npos ||
        text.find("EACCES") != std::string::npos) {
        return CaptureErrorKind::PermissionDenied;
    }
    return CaptureErrorKind::DeviceUnavailable;
}

} // namespace

int RtAudioDevice::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                          double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* device = static_cast<RtAudioDevice*>(userData);

    if (status) {
        DEBUG_LOG("RtAudioDevice: input overflow detected" << DEBUG_LOG_ENDL);
    }

    if (device->_delivering && inputBuffer && device->_callbacks.onBuffer) {
        device->_callbacks.onBuffer(static_cast<const int16_t*>(inputBuffer), nBufferFrames,
                                    device->_sampleRate);
    }
    return 0;
}

RtAudioDevice::RtAudioDevice(const CaptureDeviceConfig& config, DeviceCallbacks callbacks)
    : _callbacks(std::move(callbacks)) {
    _audio = std::make_unique<RtAudio>(RtAudio::UNSPECIFIED,
        [this](RtAudioErrorType type, const std::string& errorText) { OnStreamError(type, errorText); });

    const unsigned int deviceId = SelectInputDevice(config.inputDevice);
    OpenStream(deviceId, config.preferredSampleRate, config.bufferFrames);
}

RtAudioDevice::~RtAudioDevice() {
    Close();
}

unsigned int RtAudioDevice::SelectInputDevice(const std::string& requested) {
    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        throw CaptureError(CaptureErrorKind::DeviceUnavailable, "No audio devices found");
    }

    if (!requested.empty()) {
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio->getDeviceInfo(id);
            if (candidate.inputChannels > 0 &&
                (candidate.name == requested || std::to_string(id) == requested)) {
                _name = candidate.name;
                DEBUG_LOG("RtAudioDevice: using requested input device " << _name << " (ID: " << id << ")" << DEBUG_LOG_ENDL);
                return id;
            }
        }
        DEBUG_LOG("RtAudioDevice: input device \"" << requested << "\" not found, using default" << DEBUG_LOG_ENDL);
    }

    unsigned int selected = _audio->getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(selected);

    if (info.inputChannels < 1) {
        DEBUG_LOG("RtAudioDevice: default device has no input channels, searching for alternative" << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio->getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                selected = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        throw CaptureError(CaptureErrorKind::DeviceUnavailable, "No input devices found");
    }

    _name = info.name;
    DEBUG_LOG("RtAudioDevice: using input device " << _name << " (ID: " << selected << ")" << DEBUG_LOG_ENDL);
    return selected;
}

void RtAudioDevice::OpenStream(unsigned int deviceId, unsigned int preferredRate, unsigned int bufferFrames) {
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceId);

    unsigned int sampleRate = preferredRate;
    const bool supported = std::find(info.sampleRates.begin(), info.sampleRates.end(), preferredRate)
                           != info.sampleRates.end();
    if (!supported && info.preferredSampleRate > 0) {
        sampleRate = info.preferredSampleRate;
        DEBUG_LOG("RtAudioDevice: " << preferredRate << " Hz not supported, using preferred rate "
                  << sampleRate << DEBUG_LOG_ENDL);
    }

    RtAudio::StreamParameters parameters;
    parameters.deviceId = deviceId;
    parameters.nChannels = 1;
    parameters.firstChannel = 0;

    unsigned int frames = bufferFrames;
    RtAudioErrorType result = _audio->openStream(nullptr, &parameters, RTAUDIO_SINT16,
                                                 sampleRate, &frames, &RtAudioDevice::Record, this);
    if (result != RTAUDIO_NO_ERROR && sampleRate != 48000) {
        DEBUG_LOG("RtAudioDevice: open failed (" << _audio->getErrorText() << "), trying 48000 Hz" << DEBUG_LOG_ENDL);
        sampleRate = 48000;
        frames = bufferFrames;
        result = _audio->openStream(nullptr, &parameters, RTAUDIO_SINT16,
                                    sampleRate, &frames, &RtAudioDevice::Record, this);
    }

    if (result != RTAUDIO_NO_ERROR) {
        const std::string text = _lastError.empty() ? _audio->getErrorText() : _lastError;
        throw CaptureError(ClassifyOpenError(text), "Error opening input stream: " + text);
    }

    _sampleRate = sampleRate;
    DEBUG_LOG("RtAudioDevice: stream opened at " << _sampleRate << " Hz, " << frames << " frames" << DEBUG_LOG_ENDL);
}

void RtAudioDevice::Start() {
    std::lock_guard<std::mutex> lock(_closeMutex);
    if (!_audio || !_audio->isStreamOpen()) {
        throw CaptureError(CaptureErrorKind::DeviceFailure, "Input stream is not open");
    }
    _delivering = true;
    if (_audio->startStream() != RTAUDIO_NO_ERROR) {
        _delivering = false;
        throw CaptureError(CaptureErrorKind::DeviceFailure,
                           "Error starting input stream: " + _audio->getErrorText());
    }
}

void RtAudioDevice::Close() {
    std::lock_guard<std::mutex> lock(_closeMutex);
    _delivering = false;
    if (!_audio) {
        return;
    }
    if (_audio->isStreamRunning()) {
        _audio->stopStream();
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
        DEBUG_LOG("RtAudioDevice: released " << _name << DEBUG_LOG_ENDL);
    }
}

void RtAudioDevice::OnStreamError(RtAudioErrorType type, const std::string& errorText) {
    if (type == RTAUDIO_WARNING) {
        DEBUG_LOG("RtAudioDevice: " << errorText << DEBUG_LOG_ENDL);
        return;
    }
    _lastError = errorText;
    if (_delivering && _callbacks.onError) {
        _callbacks.onError(errorText);
    }
}

RtAudioDeviceProvider::RtAudioDeviceProvider(boost::asio::io_context& io, CaptureDeviceConfig config)
    : _io(io), _config(config) {}

void RtAudioDeviceProvider::Acquire(DeviceCallbacks callbacks, AcquireCompletion completion) {
    AcquireResult result;
    try {
        result.device = std::make_unique<RtAudioDevice>(_config, std::move(callbacks));
    } catch (const CaptureError& e) {
        result.errorKind = e.GetKind();
        result.errorMessage = e.what();
    } catch (const std::exception& e) {
        result.errorKind = CaptureErrorKind::DeviceUnavailable;
        result.errorMessage = e.what();
    }

    // The caller always resumes on a later scheduler turn; a result nobody receives is destroyed
    // with the handler, which closes the device.
    auto shared = std::make_shared<AcquireResult>(std::move(result));
    boost::asio::post(_io, [completion = std::move(completion), shared]() {
        completion(std::move(*shared));
    });
}
