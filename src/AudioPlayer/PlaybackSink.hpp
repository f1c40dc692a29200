#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Called once playback has begun (empty error) or could not begin
using PlaybackStartedCallback = std::function<void(const std::string& error)>;

// Plays one encoded clip at a time; a new Play replaces whatever is playing
class IPlaybackSink {
public:
    virtual ~IPlaybackSink() = default;

    virtual void Play(std::vector<uint8_t> audio, PlaybackStartedCallback started) = 0;
    virtual void Stop() = 0;
    virtual bool IsPlaying() const = 0;
};
