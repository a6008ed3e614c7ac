#include "sync_config.hpp"

#include <limits>
#include <stdexcept>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace edgesync {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

void read_ms(const YAML::Node& node, const char* key, std::chrono::milliseconds& value) {
    if (node[key]) {
        value = std::chrono::milliseconds(node[key].as<int64_t>());
    }
}

void apply(const YAML::Node& root, SyncConfig& config) {
    if (const auto scheduler = root["scheduler"]) {
        read(scheduler, "max_concurrent_transfers", config.scheduler.max_concurrent_transfers);
        read_ms(scheduler, "cycle_interval_ms", config.scheduler.cycle_interval);
        read(scheduler, "max_retries", config.scheduler.max_retries);
        if (const auto backoff = scheduler["backoff"]) {
            read_ms(backoff, "base_ms", config.scheduler.backoff.base);
            read(backoff, "factor", config.scheduler.backoff.factor);
            read_ms(backoff, "cap_ms", config.scheduler.backoff.cap);
            read(backoff, "jitter", config.scheduler.backoff.jitter);
        }
    }

    if (const auto transfer = root["transfer"]) {
        read(transfer, "max_chunk_attempts", config.transfer.max_chunk_attempts);
        read(transfer, "delete_source_after_sync", config.transfer.delete_source_after_sync);
    }

    if (const auto bandwidth = root["bandwidth"]) {
        read(bandwidth, "hysteresis_margin", config.bandwidth.hysteresis_margin);
        read(bandwidth, "hysteresis_probes", config.bandwidth.hysteresis_probes);
        read(bandwidth, "smoothing_alpha", config.bandwidth.smoothing_alpha);
        read_ms(bandwidth, "probe_interval_ms", config.bandwidth.probe_interval);
        read_ms(bandwidth, "offline_probe_interval_ms", config.bandwidth.offline_probe_interval);
        read_ms(bandwidth, "probe_timeout_ms", config.bandwidth.probe_timeout);
        read(bandwidth, "probe_payload_bytes", config.bandwidth.probe_payload_bytes);

        if (const auto tiers = bandwidth["tiers"]) {
            std::vector<ChunkSizeTier> parsed;
            for (const auto& tier : tiers) {
                ChunkSizeTier t;
                t.max_mbps = tier["max_mbps"] ? tier["max_mbps"].as<double>()
                                              : std::numeric_limits<double>::infinity();
                t.chunk_size = tier["chunk_size_mib"].as<uint64_t>() * kMiB;
                parsed.push_back(t);
            }
            config.bandwidth.tiers = parsed;
        }
    }

    if (const auto remote = root["remote"]) {
        read(remote, "target", config.remote.target);
        read_ms(remote, "initiate_timeout_ms", config.remote.initiate_timeout);
        read_ms(remote, "chunk_timeout_ms", config.remote.chunk_timeout);
        read_ms(remote, "complete_timeout_ms", config.remote.complete_timeout);
        read_ms(remote, "status_timeout_ms", config.remote.status_timeout);
        read(remote, "min_link_kbps", config.remote.min_link_kbps);
        read(remote, "frame_bytes", config.remote.frame_bytes);
    }
}

}  // namespace

void parse_sync_config_yaml(const std::string& yaml, SyncConfig& config) {
    try {
        apply(YAML::Load(yaml), config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid sync configuration: ") + e.what());
    }
    validate_sync_config(config);
}

void load_sync_config_yaml(const std::string& path, SyncConfig& config) {
    try {
        apply(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid sync configuration " + path + ": " + e.what());
    }
    validate_sync_config(config);
    LOG(INFO) << "Loaded sync configuration from " << path;
}

void validate_sync_config(const SyncConfig& config) {
    const auto& tiers = config.bandwidth.tiers;
    if (tiers.empty()) {
        throw std::runtime_error("bandwidth.tiers must not be empty");
    }
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (tiers[i].chunk_size == 0) {
            throw std::runtime_error("bandwidth.tiers[" + std::to_string(i) +
                                     "].chunk_size_mib must be positive");
        }
        if (!(tiers[i].max_mbps > 0.0)) {
            throw std::runtime_error("bandwidth.tiers[" + std::to_string(i) +
                                     "].max_mbps must be positive");
        }
        if (i > 0 && !(tiers[i].max_mbps > tiers[i - 1].max_mbps)) {
            throw std::runtime_error("bandwidth.tiers must have ascending max_mbps (tier " +
                                     std::to_string(i) + ")");
        }
    }

    if (config.bandwidth.probe_payload_bytes == 0) {
        throw std::runtime_error("bandwidth.probe_payload_bytes must be positive");
    }
    double floor_mbps = min_measurable_mbps(config.bandwidth);
    if (floor_mbps >= tiers.front().max_mbps) {
        throw std::runtime_error(
            "bandwidth.probe_payload_bytes " + std::to_string(config.bandwidth.probe_payload_bytes) +
            " cannot finish within probe_timeout_ms below " +
            std::to_string(tiers.front().max_mbps) + " Mbps");
    }

    if (!(config.remote.min_link_kbps > 0.0)) {
        throw std::runtime_error("remote.min_link_kbps must be positive");
    }
    if (config.remote.frame_bytes == 0 || config.remote.frame_bytes > kMaxFrameBytes) {
        throw std::runtime_error("remote.frame_bytes must be between 1 and " +
                                 std::to_string(kMaxFrameBytes));
    }
}

}  // namespace edgesync
