#include "endpoint_bandwidth_probe.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace edgesync {

std::optional<std::chrono::microseconds> EndpointBandwidthProbe::measure(
    uint64_t payload_bytes, std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        ok = endpoint_->ping(payload_bytes, timeout);
    } catch (const std::exception& e) {
        LOG(WARNING) << "Bandwidth probe failed: " << e.what();
        return std::nullopt;
    }
    if (!ok) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return std::max(elapsed, std::chrono::microseconds(1));
}

}  // namespace edgesync
