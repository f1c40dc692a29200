#include "WavEncoder.hpp"
#include "MemoryFile.hpp"
#include "../common/debug_log.hpp"

void WavEncoder::Begin(unsigned int sampleRate, unsigned int channels) {
    if (sampleRate == 0 || channels == 0) {
        throw EncoderException("Sample rate and channel count must be specified");
    }
    _audioData.clear();
    _sampleRate = sampleRate;
    _channels = channels;
    _begun = true;
}

void WavEncoder::Append(const int16_t* samples, size_t numSamples) {
    if (!_begun) {
        throw EncoderException("Append called before Begin");
    }
    if (!samples || numSamples == 0) {
        return;
    }
    _audioData.insert(_audioData.end(), samples, samples + numSamples);
}

std::vector<uint8_t> WavEncoder::Finalize() {
    if (!_begun) {
        throw EncoderException("Finalize called before Begin");
    }
    _begun = false;

    if (_audioData.empty()) {
        DEBUG_LOG("WavEncoder: no audio data to encode" << DEBUG_LOG_ENDL);
        return {};
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(_sampleRate);
    sfinfo.channels = static_cast<int>(_channels);
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    MemoryFile file;
    SNDFILE* outfile = file.Open(SFM_WRITE, &sfinfo);
    if (!outfile) {
        throw EncoderException(std::string("Could not open WAV stream: ") + sf_strerror(nullptr));
    }

    const sf_count_t written = sf_write_short(outfile, _audioData.data(),
                                              static_cast<sf_count_t>(_audioData.size()));
    sf_close(outfile);

    if (written != static_cast<sf_count_t>(_audioData.size())) {
        throw EncoderException("Wrote " + std::to_string(written) + " samples, expected " +
                               std::to_string(_audioData.size()));
    }

    DEBUG_LOG("WavEncoder: encoded " << _audioData.size() << " samples at " << _sampleRate << " Hz" << DEBUG_LOG_ENDL);
    return file.TakeData();
}

void WavEncoder::Discard() {
    _audioData.clear();
    _begun = false;
}

AudioEncoding WavEncoder::GetEncoding() const {
    AudioEncoding encoding;
    encoding.mimeType = "audio/wav";
    encoding.sampleRate = _sampleRate;
    encoding.channels = _channels;
    return encoding;
}
