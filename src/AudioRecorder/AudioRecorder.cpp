#include "AudioRecorder.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

AudioRecorder::AudioRecorder(boost::asio::io_context& io,
                             IAudioDeviceProvider& devices,
                             std::unique_ptr<IAudioEncoder> encoder,
                             RecorderConfig config,
                             CaptureContext context)
    : _io(io)
    , _devices(devices)
    , _encoder(std::move(encoder))
    , _config(std::move(config))
    , _context(std::move(context))
    , _maxLengthTimer(io)
    , _alive(std::make_shared<bool>(true)) {
    if (!_encoder) {
        throw std::invalid_argument("AudioRecorder requires an encoder");
    }
    _suppressor.SetEnabled(_config.noiseSuppression);
}

AudioRecorder::~AudioRecorder() {
    _alive.reset();
    _maxLengthTimer.cancel();
    ReleaseDevice();
    _encoder->Discard();
}

std::optional<RecordingSession> AudioRecorder::GetSession() const {
    if (_state == RecorderState::Recording || _state == RecorderState::Stopping) {
        return _session;
    }
    return std::nullopt;
}

bool AudioRecorder::StartRecording() {
    if (_startLock || _state != RecorderState::Idle) {
        DEBUG_LOG("AudioRecorder: start ignored in state " << GetRecorderStateName(_state) << DEBUG_LOG_ENDL);
        return false;
    }
    // A cancelled acquisition still owns its device until the provider answers
    if (_outstandingAcquisitions > 0) {
        DEBUG_LOG("AudioRecorder: start ignored, previous acquisition still outstanding" << DEBUG_LOG_ENDL);
        return false;
    }

    _startLock = true;
    ChangeState(RecorderState::Acquiring);

    if (!_context.secure) {
        Abort(CaptureErrorKind::UnsupportedContext,
              _context.reason.empty() ? "Microphone access requires a secure or local backend" : _context.reason);
        return false;
    }

    const uint64_t token = ++_tokenCounter;
    _acquiringToken = token;

    std::weak_ptr<bool> alive = _alive;
    ++_outstandingAcquisitions;
    try {
        _devices.Acquire(MakeDeviceCallbacks(token), [this, alive, token](AcquireResult result) {
            if (alive.expired()) {
                return;
            }
            --_outstandingAcquisitions;
            OnAcquired(token, std::move(result));
        });
    } catch (const std::exception& e) {
        --_outstandingAcquisitions;
        _acquiringToken = 0;
        Abort(CaptureErrorKind::DeviceUnavailable, e.what());
        return false;
    }
    return true;
}

bool AudioRecorder::StopRecording() {
    if (_state != RecorderState::Recording) {
        return false;
    }

    const uint64_t token = _currentToken;
    ChangeState(RecorderState::Stopping);
    _maxLengthTimer.cancel();

    // Closing the stream guarantees every buffer is already queued ahead of the stop event
    ReleaseDevice();
    Post(StopEvent{token});
    return true;
}

bool AudioRecorder::CancelRecording() {
    if (_state != RecorderState::Acquiring && _state != RecorderState::Recording &&
        _state != RecorderState::Stopping) {
        return false;
    }

    ChangeState(RecorderState::Cancelling);
    _maxLengthTimer.cancel();
    _encoder->Discard();
    ReleaseDevice();

    _currentToken = ++_tokenCounter;
    _acquiringToken = 0;
    _startLock = false;

    DEBUG_LOG("AudioRecorder: recording cancelled, token now " << _currentToken << DEBUG_LOG_ENDL);
    ChangeState(RecorderState::Idle);
    return true;
}

DeviceCallbacks AudioRecorder::MakeDeviceCallbacks(uint64_t token) {
    boost::asio::io_context* io = &_io;
    std::weak_ptr<bool> alive = _alive;

    DeviceCallbacks callbacks;
    callbacks.onBuffer = [this, io, alive, token](const int16_t* samples, size_t numSamples, unsigned int sampleRate) {
        if (!samples || numSamples == 0) {
            return;
        }
        auto event = std::make_shared<RecorderEvent>(DataEvent{token, std::vector<int16_t>(samples, samples + numSamples), sampleRate});
        boost::asio::post(*io, [this, alive, event]() {
            if (!alive.expired()) {
                Dispatch(*event);
            }
        });
    };
    callbacks.onError = [this, io, alive, token](const std::string& message) {
        auto event = std::make_shared<RecorderEvent>(ErrorEvent{token, CaptureErrorKind::DeviceFailure, message});
        boost::asio::post(*io, [this, alive, event]() {
            if (!alive.expired()) {
                Dispatch(*event);
            }
        });
    };
    return callbacks;
}

void AudioRecorder::Post(RecorderEvent event) {
    std::weak_ptr<bool> alive = _alive;
    auto shared = std::make_shared<RecorderEvent>(std::move(event));
    boost::asio::post(_io, [this, alive, shared]() {
        if (!alive.expired()) {
            Dispatch(*shared);
        }
    });
}

void AudioRecorder::Dispatch(RecorderEvent& event) {
    if (auto* data = std::get_if<DataEvent>(&event)) {
        HandleData(*data);
    } else if (auto* stop = std::get_if<StopEvent>(&event)) {
        HandleStop(*stop);
    } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
        HandleError(*error);
    }
}

void AudioRecorder::OnAcquired(uint64_t token, AcquireResult result) {
    if (token != _acquiringToken || _state != RecorderState::Acquiring) {
        DEBUG_LOG("AudioRecorder: acquisition " << token << " is stale, releasing device" << DEBUG_LOG_ENDL);
        if (result.device) {
            result.device->Close();
        }
        return;
    }

    _acquiringToken = 0;

    if (!result.Succeeded()) {
        if (result.errorKind == CaptureErrorKind::PermissionDenied) {
            _permission = PermissionState::Denied;
        }
        Abort(result.errorKind, result.errorMessage);
        return;
    }

    _permission = PermissionState::Granted;
    _device = std::move(result.device);
    BeginRecording(token);
}

void AudioRecorder::BeginRecording(uint64_t token) {
    try {
        const unsigned int sampleRate = _device->GetSampleRate();
        _encoder->Begin(sampleRate, _device->GetChannels());
        _suppressor.Reset(sampleRate);
        _suppressor.SetEnabled(_config.noiseSuppression);
        CreateLevelMeter(sampleRate);

        _currentToken = token;
        _session.token = token;
        _session.startedAt = std::chrono::steady_clock::now();
        _session.encoding = _encoder->GetEncoding();

        ChangeState(RecorderState::Recording);
        _startLock = false;
        _device->Start();
    } catch (const CaptureError& e) {
        _encoder->Discard();
        ReleaseDevice();
        _currentToken = ++_tokenCounter;
        Abort(e.GetKind(), e.what());
        return;
    } catch (const std::exception& e) {
        _encoder->Discard();
        ReleaseDevice();
        _currentToken = ++_tokenCounter;
        Abort(CaptureErrorKind::DeviceFailure, e.what());
        return;
    }

    DEBUG_LOG("AudioRecorder: recording " << token << " on " << _device->GetName()
              << " at " << _device->GetSampleRate() << " Hz" << DEBUG_LOG_ENDL);
    ArmMaxLengthTimer(token);
}

void AudioRecorder::CreateLevelMeter(unsigned int sampleRate) {
    _levelMeter.reset();
    if (!_config.vadEnabled) {
        return;
    }

    LevelMeter::Config vad = _config.vad;
    vad.sampleRate = sampleRate;
    try {
        _levelMeter = std::make_unique<LevelMeter>(vad);
    } catch (const std::invalid_argument& e) {
        ERROR_LOG("AudioRecorder: level analysis unavailable, recording without auto-stop: " << e.what());
        return;
    }

    _levelMeter->SetOnLevelCallback([this](double levelDb) {
        if (_onLevel) {
            _onLevel(levelDb);
        }
    });
}

void AudioRecorder::ArmMaxLengthTimer(uint64_t token) {
    if (_config.maxRecordingMs == 0) {
        return;
    }

    std::weak_ptr<bool> alive = _alive;
    _maxLengthTimer.expires_after(std::chrono::milliseconds(_config.maxRecordingMs));
    _maxLengthTimer.async_wait([this, alive, token](const boost::system::error_code& ec) {
        if (alive.expired() || ec) {
            return;
        }
        if (token == _currentToken && _state == RecorderState::Recording) {
            DEBUG_LOG("AudioRecorder: maximum length reached, stopping" << DEBUG_LOG_ENDL);
            StopRecording();
        }
    });
}

void AudioRecorder::HandleData(DataEvent& event) {
    if (event.token != _currentToken ||
        (_state != RecorderState::Recording && _state != RecorderState::Stopping)) {
        return;
    }

    std::vector<int16_t> samples = _suppressor.IsEnabled()
        ? _suppressor.Process(event.samples.data(), event.samples.size())
        : std::move(event.samples);
    if (samples.empty()) {
        return;
    }

    try {
        _encoder->Append(samples.data(), samples.size());
    } catch (const EncoderException& e) {
        HandleError(ErrorEvent{event.token, CaptureErrorKind::DeviceFailure, e.what()});
        return;
    }

    if (_levelMeter && _levelMeter->Feed(samples.data(), samples.size()) &&
        _state == RecorderState::Recording) {
        DEBUG_LOG("AudioRecorder: sustained silence, stopping recording " << event.token << DEBUG_LOG_ENDL);
        if (_onSilence) {
            _onSilence(event.token);
        }
        StopRecording();
    }
}

void AudioRecorder::HandleStop(const StopEvent& event) {
    if (event.token != _currentToken || _state != RecorderState::Stopping) {
        DEBUG_LOG("AudioRecorder: dropping stale stop for recording " << event.token << DEBUG_LOG_ENDL);
        return;
    }

    Utterance utterance;
    utterance.token = event.token;
    utterance.encoding = _encoder->GetEncoding();
    utterance.sampleCount = _encoder->GetSampleCount();

    try {
        utterance.data = _encoder->Finalize();
    } catch (const EncoderException& e) {
        _currentToken = ++_tokenCounter;
        Abort(CaptureErrorKind::DeviceFailure, e.what());
        return;
    }

    const unsigned int rate = utterance.encoding.sampleRate * std::max(1u, utterance.encoding.channels);
    utterance.durationSeconds = rate ? static_cast<double>(utterance.sampleCount) / rate : 0.0;
    _lastDurationSeconds = utterance.durationSeconds;

    ChangeState(RecorderState::Idle);

    if (utterance.IsEmpty()) {
        DEBUG_LOG("AudioRecorder: recording " << event.token << " is empty, nothing to deliver" << DEBUG_LOG_ENDL);
        return;
    }
    if (utterance.token != _currentToken) {
        return;
    }

    DEBUG_LOG("AudioRecorder: utterance " << utterance.token << " ready, " << utterance.durationSeconds
              << " s, " << utterance.data.size() << " bytes" << DEBUG_LOG_ENDL);
    if (_onUtterance) {
        _onUtterance(utterance);
    }
}

void AudioRecorder::HandleError(const ErrorEvent& event) {
    if (event.token != _currentToken ||
        (_state != RecorderState::Recording && _state != RecorderState::Stopping)) {
        return;
    }

    _maxLengthTimer.cancel();
    _encoder->Discard();
    ReleaseDevice();
    _currentToken = ++_tokenCounter;
    Abort(event.kind, event.message);
}

void AudioRecorder::ReleaseDevice() {
    if (_device) {
        _device->Close();
        _device.reset();
    }
}

void AudioRecorder::Abort(CaptureErrorKind kind, const std::string& message) {
    _startLock = false;
    ERROR_LOG("AudioRecorder: " << GetCaptureErrorName(kind) << ": " << message);

    ChangeState(RecorderState::Error);
    if (_onError) {
        _onError(kind, message);
    }
    ChangeState(RecorderState::Idle);
}

void AudioRecorder::ChangeState(RecorderState newState) {
    if (_state == newState) {
        return;
    }
    DEBUG_LOG("AudioRecorder: " << GetRecorderStateName(_state) << " -> " << GetRecorderStateName(newState) << DEBUG_LOG_ENDL);
    _state = newState;
    if (_onState) {
        _onState(newState);
    }
}
