#include "WavDecoder.hpp"
#include "IAudioEncoder.hpp"
#include "MemoryFile.hpp"

#include <exception>
#include <string>

DecodedAudio DecodeAudio(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        throw EncoderException("No audio data to decode");
    }

    MemoryFile file(encoded);
    SF_INFO sfinfo{};
    SNDFILE* infile = file.Open(SFM_READ, &sfinfo);
    if (!infile) {
        throw EncoderException(std::string("Could not parse audio: ") + sf_strerror(nullptr));
    }

    if (sfinfo.channels < 1 || sfinfo.samplerate < 1 || sfinfo.frames < 0 ||
        sfinfo.frames > kMaxDecodedSamples / sfinfo.channels) {
        sf_close(infile);
        throw EncoderException("Audio header describes an unusable stream");
    }

    DecodedAudio decoded;
    decoded.sampleRate = static_cast<unsigned int>(sfinfo.samplerate);
    decoded.channels = static_cast<unsigned int>(sfinfo.channels);
    try {
        decoded.samples.resize(static_cast<size_t>(sfinfo.frames * sfinfo.channels));
    } catch (const std::exception& e) {
        sf_close(infile);
        throw EncoderException(std::string("Could not allocate decoded audio: ") + e.what());
    }

    const sf_count_t read = sf_readf_short(infile, decoded.samples.data(), sfinfo.frames);
    sf_close(infile);

    if (read < 0) {
        throw EncoderException("Failed to read audio frames");
    }
    decoded.samples.resize(static_cast<size_t>(read * sfinfo.channels));
    return decoded;
}
