#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "sndfile.h"

// In-memory file for libsndfile virtual I/O, so encoded audio never touches the disk.
class MemoryFile {
public:
    MemoryFile() = default;
    explicit MemoryFile(std::vector<uint8_t> data) : _data(std::move(data)) {}

    SNDFILE* Open(int mode, SF_INFO* info);

    const std::vector<uint8_t>& GetData() const { return _data; }
    std::vector<uint8_t> TakeData() { return std::move(_data); }

private:
    static sf_count_t GetLength(void* userData);
    static sf_count_t Seek(sf_count_t offset, int whence, void* userData);
    static sf_count_t Read(void* ptr, sf_count_t count, void* userData);
    static sf_count_t Write(const void* ptr, sf_count_t count, void* userData);
    static sf_count_t Tell(void* userData);

    std::vector<uint8_t> _data;
    sf_count_t _position = 0;
    SF_VIRTUAL_IO _io{};
};
