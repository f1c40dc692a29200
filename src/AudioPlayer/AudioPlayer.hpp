#pragma once

#include <RtAudio.h>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "PlaybackSink.hpp"

// Speaker output through RtAudio. The clip is decoded with libsndfile and streamed from memory.
class AudioPlayer : public IPlaybackSink {
public:
    explicit AudioPlayer(boost::asio::io_context& io, unsigned int bufferFrames = 512);
    ~AudioPlayer() override;

    AudioPlayer(const AudioPlayer&) = delete;
    AudioPlayer& operator=(const AudioPlayer&) = delete;

    void Play(std::vector<uint8_t> audio, PlaybackStartedCallback started) override;
    void Stop() override;
    bool IsPlaying() const override { return _playing; }

private:
    struct Clip {
        std::vector<int16_t> samples;
        unsigned int channels = 1;
        size_t position = 0;
        uint64_t generation = 0;
        AudioPlayer* owner = nullptr;
        std::weak_ptr<bool> alive;
    };

    static int Playback(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                        double streamTime, RtAudioStreamStatus status, void* userData);

    void Open(std::vector<int16_t> samples, unsigned int sampleRate, unsigned int channels);
    void OnFinished(uint64_t generation);
    void CloseStream();
    void Report(PlaybackStartedCallback started, const std::string& error);

    boost::asio::io_context& _io;
    unsigned int _bufferFrames;
    std::unique_ptr<RtAudio> _audio;
    std::unique_ptr<Clip> _clip;
    std::mutex _streamMutex;
    std::atomic<bool> _playing{false};
    uint64_t _generation = 0;
    std::string _lastError;
    std::shared_ptr<bool> _alive;
};
