#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "AudioDevice.hpp"
#include "CaptureError.hpp"
#include "LevelMeter.hpp"
#include "NoiseSuppressor.hpp"
#include "RecordData.hpp"
#include "../Encoding/IAudioEncoder.hpp"

struct RecorderConfig {
    unsigned int maxRecordingMs = 60000;  // 0 disables the hard stop
    bool noiseSuppression = true;
    bool vadEnabled = true;
    LevelMeter::Config vad;  // sampleRate is taken from the acquired device
};

// Whether the process may open the microphone at all (see IsSecureEndpoint)
struct CaptureContext {
    bool secure = true;
    std::string reason;
};

// Microphone capture engine.
//
// Idle -> Acquiring -> Recording -> Stopping -> Idle, with Cancelling reachable from Acquiring,
// Recording and Stopping, and Error from anywhere. All methods and callbacks run on the io_context
// thread. Device buffers arrive on the audio thread and are posted to the io_context as
// token-tagged events, so a buffer, stop or error from a superseded recording is dropped.
class AudioRecorder {
public:
    using UtteranceCallback = std::function<void(const Utterance&)>;
    using ErrorCallback = std::function<void(CaptureErrorKind, const std::string&)>;
    using StateCallback = std::function<void(RecorderState)>;
    using LevelCallback = std::function<void(double levelDb)>;
    using SilenceCallback = std::function<void(uint64_t token)>;

    AudioRecorder(boost::asio::io_context& io,
                  IAudioDeviceProvider& devices,
                  std::unique_ptr<IAudioEncoder> encoder,
                  RecorderConfig config,
                  CaptureContext context = {});
    ~AudioRecorder();

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    // Returns false when the call was ignored or failed synchronously
    bool StartRecording();
    bool StopRecording();
    bool CancelRecording();

    RecorderState GetState() const { return _state; }
    bool IsRecording() const { return _state == RecorderState::Recording; }
    uint64_t GetCurrentToken() const { return _currentToken; }
    PermissionState GetPermission() const { return _permission; }
    bool IsVadActive() const { return _levelMeter != nullptr; }
    double GetLastDurationSeconds() const { return _lastDurationSeconds; }
    std::optional<RecordingSession> GetSession() const;

    void SetOnUtteranceCallback(UtteranceCallback cb) { _onUtterance = std::move(cb); }
    void SetOnErrorCallback(ErrorCallback cb) { _onError = std::move(cb); }
    void SetOnStateCallback(StateCallback cb) { _onState = std::move(cb); }
    void SetOnLevelCallback(LevelCallback cb) { _onLevel = std::move(cb); }
    void SetOnSilenceCallback(SilenceCallback cb) { _onSilence = std::move(cb); }

private:
    struct DataEvent {
        uint64_t token;
        std::vector<int16_t> samples;
        unsigned int sampleRate;
    };
    struct StopEvent {
        uint64_t token;
    };
    struct ErrorEvent {
        uint64_t token;
        CaptureErrorKind kind;
        std::string message;
    };
    using RecorderEvent = std::variant<DataEvent, StopEvent, ErrorEvent>;

    DeviceCallbacks MakeDeviceCallbacks(uint64_t token);
    void Post(RecorderEvent event);
    void Dispatch(RecorderEvent& event);
    void HandleData(DataEvent& event);
    void HandleStop(const StopEvent& event);
    void HandleError(const ErrorEvent& event);

    void OnAcquired(uint64_t token, AcquireResult result);
    void BeginRecording(uint64_t token);
    void CreateLevelMeter(unsigned int sampleRate);
    void ArmMaxLengthTimer(uint64_t token);
    void ReleaseDevice();
    void Abort(CaptureErrorKind kind, const std::string& message);
    void ChangeState(RecorderState newState);

    boost::asio::io_context& _io;
    IAudioDeviceProvider& _devices;
    std::unique_ptr<IAudioEncoder> _encoder;
    RecorderConfig _config;
    CaptureContext _context;

    NoiseSuppressor _suppressor;
    std::unique_ptr<LevelMeter> _levelMeter;
    AudioDevicePtr _device;
    boost::asio::steady_timer _maxLengthTimer;

    RecorderState _state = RecorderState::Idle;
    bool _startLock = false;
    uint64_t _tokenCounter = 0;
    uint64_t _currentToken = 0;
    uint64_t _acquiringToken = 0;
    int _outstandingAcquisitions = 0;
    RecordingSession _session;
    PermissionState _permission = PermissionState::Unknown;
    double _lastDurationSeconds = 0.0;

    UtteranceCallback _onUtterance;
    ErrorCallback _onError;
    StateCallback _onState;
    LevelCallback _onLevel;
    SilenceCallback _onSilence;

    // Posted events and timers hold a weak reference and become no-ops once the recorder is gone
    std::shared_ptr<bool> _alive;
};
