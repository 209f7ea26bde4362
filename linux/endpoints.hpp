#pragma once

#include <stream/endpoints.hpp>
#include <types/config.hpp>

namespace endpoints {

// Sources and sinks backed by PipeWire and the filesystem
class LinuxEndpoints : public l2stream::stream::EndpointFactory {
public:
    explicit LinuxEndpoints(const l2stream::Config& config) : config_(config) {}

    std::unique_ptr<l2stream::stream::Source> open_source() override;
    std::vector<std::unique_ptr<l2stream::stream::Sink>> open_sinks(
        const std::shared_ptr<l2stream::transport::Socket>& socket, bool sending) override;
    size_t chunk_size(const l2stream::transport::Socket& socket,
                      l2stream::stream::Direction direction) const override;

private:
    l2stream::Config config_;
};

} // namespace endpoints
