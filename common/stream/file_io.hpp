#pragma once

#include "endpoints.hpp"
#include <fstream>
#include <string>

namespace l2stream::stream {

// Sequential reader over a raw byte file
class FileSource : public Source {
public:
    explicit FileSource(bool paced = false) : paced_(paced) {}

    bool open(const std::string& path);

    std::optional<size_t> read(std::span<uint8_t> data) override;
    bool live() const override { return false; }
    bool paced() const override { return paced_; }
    void close() override;

    // Bytes left between the read position and end of file
    size_t remaining();

private:
    std::ifstream in_;
    bool paced_;
};

class FileSink : public Sink {
public:
    bool open(const std::string& path);

    SinkKind kind() const override { return SinkKind::File; }
    bool write(std::span<const uint8_t> data) override;
    void close() override;

private:
    std::ofstream out_;
};

} // namespace l2stream::stream
