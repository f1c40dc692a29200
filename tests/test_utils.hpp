#pragma once

#include "AudioRecorder/AudioDevice.hpp"
#include "AudioPlayer/PlaybackSink.hpp"
#include "Backend/IBackendClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_utils {

// Runs every handler that is ready without blocking
inline size_t RunPending(boost::asio::io_context& io) {
    io.restart();
    return io.poll();
}

class TestAudioGenerator {
public:
    explicit TestAudioGenerator(unsigned int sampleRate, double frequency = 440.0)
        : _sampleRate(sampleRate)
        , _frequency(frequency)
        , _phase(0.0)
    {}

    // Sine whose RMS equals levelDb relative to full scale
    std::vector<int16_t> Tone(double levelDb, double seconds) {
        const double amplitude = std::sqrt(2.0) * std::pow(10.0, levelDb / 20.0);
        const double phaseIncrement = 2.0 * M_PI * _frequency / _sampleRate;

        std::vector<int16_t> samples(Count(seconds));
        for (auto& sample : samples) {
            sample = static_cast<int16_t>(std::sin(_phase) * amplitude * 32767.0);
            _phase += phaseIncrement;
            if (_phase > 2.0 * M_PI) {
                _phase -= 2.0 * M_PI;
            }
        }
        return samples;
    }

    std::vector<int16_t> Silence(double seconds) const {
        return std::vector<int16_t>(Count(seconds), 0);
    }

private:
    size_t Count(double seconds) const {
        return static_cast<size_t>(std::lround(seconds * _sampleRate));
    }

    unsigned int _sampleRate;
    double _frequency;
    double _phase;
};

// State shared between a fake device and the provider that opened it
struct FakeDeviceChannel {
    DeviceCallbacks callbacks;
    unsigned int sampleRate = 16000;
    bool started = false;
    bool closed = false;
};

// How a fake device reacts to Start()
enum class StartFailure {
    None,
    Capture,    // throws CaptureError like a real driver refusing the stream
    Unexpected  // throws something the device contract does not promise
};

struct DeviceCounters {
    int open = 0;
    int maxOpen = 0;
    int acquisitions = 0;
};

class FakeAudioDevice : public IAudioDevice {
public:
    FakeAudioDevice(std::shared_ptr<FakeDeviceChannel> channel, std::shared_ptr<DeviceCounters> counters,
                    StartFailure startFailure)
        : _channel(std::move(channel)), _counters(std::move(counters)), _startFailure(startFailure) {
        ++_counters->open;
        _counters->maxOpen = std::max(_counters->maxOpen, _counters->open);
    }

    ~FakeAudioDevice() override { Close(); }

    void Start() override {
        if (_startFailure == StartFailure::Capture) {
            throw CaptureError(CaptureErrorKind::DeviceFailure, "fake device refused to start");
        }
        if (_startFailure == StartFailure::Unexpected) {
            throw std::logic_error("fake driver state corrupted");
        }
        _channel->started = true;
    }

    void Close() override {
        if (_channel->closed) return;
        _channel->closed = true;
        _channel->started = false;
        --_counters->open;
    }

    unsigned int GetSampleRate() const override { return _channel->sampleRate; }
    unsigned int GetChannels() const override { return 1; }
    std::string GetName() const override { return "fake microphone"; }

private:
    std::shared_ptr<FakeDeviceChannel> _channel;
    std::shared_ptr<DeviceCounters> _counters;
    StartFailure _startFailure;
};

// Hands out fake devices. With SetDeferred(true) acquisitions wait for CompletePending(), which
// models a slow permission prompt.
class FakeDeviceProvider : public IAudioDeviceProvider {
public:
    explicit FakeDeviceProvider(boost::asio::io_context& io, unsigned int sampleRate = 16000)
        : _io(io), _sampleRate(sampleRate), _counters(std::make_shared<DeviceCounters>()) {}

    void Acquire(DeviceCallbacks callbacks, AcquireCompletion completion) override {
        ++_counters->acquisitions;
        if (_deferred) {
            _pending.emplace_back(std::move(callbacks), std::move(completion));
            return;
        }
        Complete(std::move(callbacks), std::move(completion));
    }

    void CompletePending() {
        auto pending = std::move(_pending);
        _pending.clear();
        for (auto& entry : pending) {
            Complete(std::move(entry.first), std::move(entry.second));
        }
    }

    // Delivers a buffer the way the audio thread would; ignored unless the last device is running
    bool Push(const std::vector<int16_t>& samples, size_t chunk = 256) {
        if (!_channel || !_channel->started || _channel->closed) {
            return false;
        }
        for (size_t offset = 0; offset < samples.size(); offset += chunk) {
            const size_t count = std::min(chunk, samples.size() - offset);
            _channel->callbacks.onBuffer(samples.data() + offset, count, _channel->sampleRate);
        }
        return true;
    }

    bool FailStream(const std::string& message) {
        if (!_channel || !_channel->started) {
            return false;
        }
        _channel->callbacks.onError(message);
        return true;
    }

    void SetDeferred(bool deferred) { _deferred = deferred; }
    void SetStartFailure(StartFailure failure) { _startFailure = failure; }
    void FailWith(CaptureErrorKind kind, std::string message) {
        _failure = std::make_pair(kind, std::move(message));
    }
    void ClearFailure() { _failure.reset(); }

    int GetOpenCount() const { return _counters->open; }
    int GetMaxOpenCount() const { return _counters->maxOpen; }
    int GetAcquireCount() const { return _counters->acquisitions; }
    size_t GetPendingCount() const { return _pending.size(); }

private:
    void Complete(DeviceCallbacks callbacks, AcquireCompletion completion) {
        auto result = std::make_shared<AcquireResult>();
        if (_failure) {
            result->errorKind = _failure->first;
            result->errorMessage = _failure->second;
        } else {
            _channel = std::make_shared<FakeDeviceChannel>();
            _channel->callbacks = std::move(callbacks);
            _channel->sampleRate = _sampleRate;
            result->device = std::make_unique<FakeAudioDevice>(_channel, _counters, _startFailure);
        }
        boost::asio::post(_io, [completion = std::move(completion), result]() {
            completion(std::move(*result));
        });
    }

    boost::asio::io_context& _io;
    unsigned int _sampleRate;
    std::shared_ptr<DeviceCounters> _counters;
    std::shared_ptr<FakeDeviceChannel> _channel;
    std::deque<std::pair<DeviceCallbacks, AcquireCompletion>> _pending;
    std::optional<std::pair<CaptureErrorKind, std::string>> _failure;
    bool _deferred = false;
    StartFailure _startFailure = StartFailure::None;
};

// Records every request and keeps its completion until the test resolves it
class FakeBackendClient : public IBackendClient {
public:
    void StartSession(const SessionContext& context, RemoteCallback<SessionStarted> callback) override {
        startRequests.push_back(context);
        _start.push_back(std::move(callback));
    }
    void NextQuestion(const std::string& sessionId, RemoteCallback<QuestionInfo> callback) override {
        nextRequests.push_back(sessionId);
        _next.push_back(std::move(callback));
    }
    void SubmitAnswerAudio(const AnswerAudioRequest& request, RemoteCallback<Transcript> callback) override {
        audioRequests.push_back(request);
        _audio.push_back(std::move(callback));
    }
    void SubmitAnswerText(const AnswerTextRequest& request, RemoteCallback<Empty> callback) override {
        textRequests.push_back(request);
        _text.push_back(std::move(callback));
    }
    void SynthesizeReply(const ReplyRequest& request, RemoteCallback<SynthesizedAudio> callback) override {
        replyRequests.push_back(request);
        _reply.push_back(std::move(callback));
    }
    void ScoreAnswer(const std::string& sessionId, const std::string& questionId,
                     RemoteCallback<ScoreResult> callback) override {
        scoreRequests.emplace_back(sessionId, questionId);
        _score.push_back(std::move(callback));
    }
    void FetchReport(const std::string& sessionId, RemoteCallback<SessionReport> callback) override {
        reportRequests.push_back(sessionId);
        _report.push_back(std::move(callback));
    }
    void WarmUp() override { ++warmUpCalls; }
    void CheckHealth(RemoteCallback<HealthStatus> callback) override {
        ++healthCalls;
        if (callback) {
            callback(RemoteResult<HealthStatus>::Success(HealthStatus{"fake", "1.0"}));
        }
    }

    void CompleteStart(const std::string& sessionId, const std::string& questionId, const std::string& question) {
        Resolve(_start, RemoteResult<SessionStarted>::Success(SessionStarted{sessionId, questionId, question}));
    }
    void FailStart(const std::string& error) { Resolve(_start, RemoteResult<SessionStarted>::Failure(error)); }

    void CompleteNext(const std::string& questionId, const std::string& question) {
        Resolve(_next, RemoteResult<QuestionInfo>::Success(QuestionInfo{questionId, question}));
    }
    void FailNext(const std::string& error) { Resolve(_next, RemoteResult<QuestionInfo>::Failure(error)); }

    void CompleteAudio(const std::string& transcript) {
        Transcript result;
        result.text = transcript;
        Resolve(_audio, RemoteResult<Transcript>::Success(result));
    }
    void FailAudio(const std::string& error) { Resolve(_audio, RemoteResult<Transcript>::Failure(error)); }

    void CompleteText() { Resolve(_text, RemoteResult<Empty>::Success(Empty{})); }

    void CompleteReply(std::vector<uint8_t> audio = {1, 2, 3, 4}) {
        Resolve(_reply, RemoteResult<SynthesizedAudio>::Success(SynthesizedAudio{std::move(audio), "audio/wav"}));
    }
    void FailReply(const std::string& error) { Resolve(_reply, RemoteResult<SynthesizedAudio>::Failure(error)); }

    void CompleteScore(int overall, std::vector<std::string> tips = {}) {
        ScoreResult result;
        result.scores = ScoreBreakdown{overall, overall, overall, overall};
        result.tips = std::move(tips);
        Resolve(_score, RemoteResult<ScoreResult>::Success(result));
    }
    void FailScore(const std::string& error) { Resolve(_score, RemoteResult<ScoreResult>::Failure(error)); }

    void CompleteReport(SessionReport report) {
        Resolve(_report, RemoteResult<SessionReport>::Success(std::move(report)));
    }

    size_t PendingAudio() const { return _audio.size(); }
    size_t PendingReply() const { return _reply.size(); }

    std::vector<SessionContext> startRequests;
    std::vector<std::string> nextRequests;
    std::vector<AnswerAudioRequest> audioRequests;
    std::vector<AnswerTextRequest> textRequests;
    std::vector<ReplyRequest> replyRequests;
    std::vector<std::pair<std::string, std::string>> scoreRequests;
    std::vector<std::string> reportRequests;
    int warmUpCalls = 0;
    int healthCalls = 0;

private:
    // Oldest first; the completion is destroyed before returning, like a finished transport call
    template <typename T>
    static void Resolve(std::deque<RemoteCallback<T>>& queue, RemoteResult<T> result) {
        if (queue.empty()) return;
        RemoteCallback<T> callback = std::move(queue.front());
        queue.pop_front();
        if (callback) {
            callback(std::move(result));
        }
    }

    std::deque<RemoteCallback<SessionStarted>> _start;
    std::deque<RemoteCallback<QuestionInfo>> _next;
    std::deque<RemoteCallback<Transcript>> _audio;
    std::deque<RemoteCallback<Empty>> _text;
    std::deque<RemoteCallback<SynthesizedAudio>> _reply;
    std::deque<RemoteCallback<ScoreResult>> _score;
    std::deque<RemoteCallback<SessionReport>> _report;
};

class FakePlaybackSink : public IPlaybackSink {
public:
    void Play(std::vector<uint8_t> audio, PlaybackStartedCallback started) override {
        played.push_back(std::move(audio));
        _playing = startError.empty();
        if (started) {
            started(startError);
        }
    }
    void Stop() override { _playing = false; }
    bool IsPlaying() const override { return _playing; }

    std::vector<std::vector<uint8_t>> played;
    std::string startError;

private:
    bool _playing = false;
};

} // namespace test_utils
