#include "MemoryFile.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

SNDFILE* MemoryFile::Open(int mode, SF_INFO* info) {
    _position = 0;
    _io.get_filelen = &MemoryFile::GetLength;
    _io.seek = &MemoryFile::Seek;
    _io.read = &MemoryFile::Read;
    _io.write = &MemoryFile::Write;
    _io.tell = &MemoryFile::Tell;
    return sf_open_virtual(&_io, mode, info, this);
}

sf_count_t MemoryFile::GetLength(void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    return static_cast<sf_count_t>(file->_data.size());
}

sf_count_t MemoryFile::Seek(sf_count_t offset, int whence, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    sf_count_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = file->_position + offset; break;
        case SEEK_END: target = static_cast<sf_count_t>(file->_data.size()) + offset; break;
        default: return -1;
    }
    if (target < 0) {
        return -1;
    }
    file->_position = target;
    return file->_position;
}

sf_count_t MemoryFile::Read(void* ptr, sf_count_t count, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    const sf_count_t size = static_cast<sf_count_t>(file->_data.size());
    if (file->_position >= size || count <= 0) {
        return 0;
    }
    const sf_count_t n = std::min(count, size - file->_position);
    std::memcpy(ptr, file->_data.data() + file->_position, static_cast<size_t>(n));
    file->_position += n;
    return n;
}

sf_count_t MemoryFile::Write(const void* ptr, sf_count_t count, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    if (count <= 0) {
        return 0;
    }
    const size_t end = static_cast<size_t>(file->_position + count);
    if (end > file->_data.size()) {
        file->_data.resize(end);
    }
    std::memcpy(file->_data.data() + file->_position, ptr, static_cast<size_t>(count));
    file->_position += count;
    return count;
}

sf_count_t MemoryFile::Tell(void* userData) {
    return static_cast<MemoryFile*>(userData)->_position;
}
