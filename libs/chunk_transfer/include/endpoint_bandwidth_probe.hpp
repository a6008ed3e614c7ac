#pragma once

#include <memory>

#include "bandwidth_monitor.hpp"
#include "remote_endpoint.hpp"

namespace edgesync {

/// Measures throughput by timing a ping round trip to the remote endpoint
class EndpointBandwidthProbe : public BandwidthProbe {
public:
    explicit EndpointBandwidthProbe(std::shared_ptr<RemoteEndpoint> endpoint)
        : endpoint_(std::move(endpoint)) {}

    std::optional<std::chrono::microseconds> measure(
        uint64_t payload_bytes, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<RemoteEndpoint> endpoint_;
};

}  // namespace edgesync
