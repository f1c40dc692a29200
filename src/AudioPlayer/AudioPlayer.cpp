#include "AudioPlayer.hpp"
#include "../Encoding/IAudioEncoder.hpp"
#include "../Encoding/WavDecoder.hpp"
#include "../common/debug_log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

int AudioPlayer::Playback(void* outputBuffer, void* /*inputBuffer*/, unsigned int nBufferFrames,
                          double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* clip = static_cast<Clip*>(userData);
    auto* out = static_cast<int16_t*>(outputBuffer);

    if (status) {
        DEBUG_LOG("AudioPlayer: output underflow detected" << DEBUG_LOG_ENDL);
    }

    const size_t wanted = static_cast<size_t>(nBufferFrames) * clip->channels;
    const size_t available = clip->samples.size() - clip->position;
    const size_t count = std::min(wanted, available);

    std::memcpy(out, clip->samples.data() + clip->position, count * sizeof(int16_t));
    std::memset(out + count, 0, (wanted - count) * sizeof(int16_t));
    clip->position += count;

    if (clip->position < clip->samples.size()) {
        return 0;
    }

    // Drain the last buffer, then let the scheduler close the stream
    AudioPlayer* owner = clip->owner;
    const uint64_t generation = clip->generation;
    std::weak_ptr<bool> alive = clip->alive;
    boost::asio::post(owner->_io, [owner, alive, generation]() {
        if (!alive.expired()) owner->OnFinished(generation);
    });
    return 1;
}

AudioPlayer::AudioPlayer(boost::asio::io_context& io, unsigned int bufferFrames)
    : _io(io), _bufferFrames(bufferFrames), _alive(std::make_shared<bool>(true)) {
    _audio = std::make_unique<RtAudio>(RtAudio::UNSPECIFIED,
        [this](RtAudioErrorType type, const std::string& errorText) {
            if (type == RTAUDIO_WARNING) {
                DEBUG_LOG("AudioPlayer: " << errorText << DEBUG_LOG_ENDL);
                return;
            }
            _lastError = errorText;
        });
}

AudioPlayer::~AudioPlayer() {
    CloseStream();
    _alive.reset();
}

void AudioPlayer::Play(std::vector<uint8_t> audio, PlaybackStartedCallback started) {
    Stop();

    DecodedAudio decoded;
    try {
        decoded = DecodeAudio(audio);
    } catch (const EncoderException& e) {
        Report(std::move(started), e.what());
        return;
    }
    if (decoded.samples.empty()) {
        Report(std::move(started), "Audio clip has no samples");
        return;
    }

    try {
        Open(std::move(decoded.samples), decoded.sampleRate, decoded.channels);
    } catch (const std::exception& e) {
        ERROR_LOG("AudioPlayer: " << e.what());
        CloseStream();
        Report(std::move(started), e.what());
        return;
    }
    Report(std::move(started), std::string());
}

void AudioPlayer::Stop() {
    ++_generation;
    CloseStream();
}

void AudioPlayer::Open(std::vector<int16_t> samples, unsigned int sampleRate, unsigned int channels) {
    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        throw std::runtime_error("No audio devices found");
    }

    unsigned int deviceId = _audio->getDefaultOutputDevice();
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceId);
    if (info.outputChannels < 1) {
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio->getDeviceInfo(id);
            if (candidate.outputChannels > 0) {
                deviceId = id;
                info = candidate;
                break;
            }
        }
    }
    if (info.outputChannels < channels) {
        throw std::runtime_error("No output device with " + std::to_string(channels) + " channel(s)");
    }

    std::lock_guard<std::mutex> lock(_streamMutex);
    _clip = std::make_unique<Clip>();
    _clip->samples = std::move(samples);
    _clip->channels = channels;
    _clip->generation = ++_generation;
    _clip->owner = this;
    _clip->alive = _alive;

    RtAudio::StreamParameters parameters;
    parameters.deviceId = deviceId;
    parameters.nChannels = channels;
    parameters.firstChannel = 0;

    unsigned int frames = _bufferFrames;
    _lastError.clear();
    if (_audio->openStream(&parameters, nullptr, RTAUDIO_SINT16, sampleRate, &frames,
                           &AudioPlayer::Playback, _clip.get()) != RTAUDIO_NO_ERROR) {
        throw std::runtime_error("Error opening output stream: " + _audio->getErrorText());
    }
    if (_audio->startStream() != RTAUDIO_NO_ERROR) {
        throw std::runtime_error("Error starting output stream: " + _audio->getErrorText());
    }

    _playing = true;
    DEBUG_LOG("AudioPlayer: playing " << _clip->samples.size() / channels << " frames at "
              << sampleRate << " Hz on " << info.name << DEBUG_LOG_ENDL);
}

void AudioPlayer::OnFinished(uint64_t generation) {
    if (generation != _generation) return;
    DEBUG_LOG("AudioPlayer: playback finished" << DEBUG_LOG_ENDL);
    CloseStream();
}

void AudioPlayer::CloseStream() {
    std::lock_guard<std::mutex> lock(_streamMutex);
    _playing = false;
    if (!_audio) return;
    if (_audio->isStreamRunning()) {
        _audio->stopStream();
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
    }
    _clip.reset();
}

void AudioPlayer::Report(PlaybackStartedCallback started, const std::string& error) {
    if (!started) return;
    std::weak_ptr<bool> alive = _alive;
    boost::asio::post(_io, [started = std::move(started), alive, error]() {
        if (!alive.expired()) started(error);
    });
}
