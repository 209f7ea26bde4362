#include "file_io.hpp"
#include <iostream>

namespace l2stream::stream {

bool FileSource::open(const std::string& path) {
    in_.open(path, std::ios::in | std::ios::binary);
    if (!in_.is_open()) {
        std::cerr << "file: cannot open " << path << " for reading" << std::endl;
        return false;
    }
    std::cout << "file: opened " << path << ", " << remaining() << " bytes available" << std::endl;
    return true;
}

std::optional<size_t> FileSource::read(std::span<uint8_t> data) {
    if (!in_.is_open()) return std::nullopt;
    if (in_.eof()) return 0;

    in_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    auto n = static_cast<size_t>(in_.gcount());

    // A short read at end of file sets failbit together with eofbit
    if (in_.bad() || (in_.fail() && !in_.eof())) {
        std::cerr << "file: read error" << std::endl;
        return std::nullopt;
    }
    return n;
}

size_t FileSource::remaining() {
    if (!in_.is_open() || !in_.good()) return 0;

    auto pos = in_.tellg();
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    in_.seekg(pos);
    if (pos < 0 || end < pos) return 0;
    return static_cast<size_t>(end - pos);
}

void FileSource::close() {
    if (in_.is_open()) {
        in_.close();
    }
}

bool FileSink::open(const std::string& path) {
    out_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        std::cerr << "file: cannot open " << path << " for writing" << std::endl;
        return false;
    }
    std::cout << "file: writing to " << path << std::endl;
    return true;
}

bool FileSink::write(std::span<const uint8_t> data) {
    if (!out_.is_open()) return false;

    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return out_.good();
}

void FileSink::close() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

} // namespace l2stream::stream
