#pragma once

#include <string>

#include "bandwidth_monitor.hpp"
#include "chunk_transfer.hpp"
#include "grpc_remote_endpoint.hpp"
#include "sync_scheduler.hpp"

namespace edgesync {

/// All engine tunables
struct SyncConfig {
    BandwidthConfig bandwidth;
    TransferConfig transfer;
    SchedulerConfig scheduler;
    RemoteEndpointConfig remote;
};

/**
 * Overlay settings from a YAML file onto config
 *
 * Keys that are absent keep their current value. Layout:
 *
 *   scheduler: {max_concurrent_transfers, cycle_interval_ms, max_retries,
 *               backoff: {base_ms, factor, cap_ms, jitter}}
 *   transfer:  {max_chunk_attempts, delete_source_after_sync}
 *   bandwidth: {hysteresis_margin, hysteresis_probes, smoothing_alpha,
 *               probe_interval_ms, offline_probe_interval_ms,
 *               probe_timeout_ms, probe_payload_bytes,
 *               tiers: [{max_mbps, chunk_size_mib}, ...]}
 *   remote:    {target, initiate_timeout_ms, chunk_timeout_ms,
 *               complete_timeout_ms, status_timeout_ms, min_link_kbps,
 *               frame_bytes}
 *
 * The result is checked with validate_sync_config.
 *
 * @throws std::runtime_error if the file cannot be read, a value has the
 *         wrong type or the result is invalid
 */
void load_sync_config_yaml(const std::string& path, SyncConfig& config);

/// Same as load_sync_config_yaml, from an in-memory document
void parse_sync_config_yaml(const std::string& yaml, SyncConfig& config);

/// Largest UploadChunk frame; stays under the default 4 MiB gRPC limit
constexpr uint64_t kMaxFrameBytes = 3 * kMiB;

/**
 * Reject settings the engine cannot work with
 *
 * Tiers need a positive chunk size and strictly ascending bounds. The probe
 * payload must be measurable within probe_timeout below the lowest tier
 * boundary, or a slow but working link would probe as offline.
 *
 * @throws std::runtime_error naming the offending setting
 */
void validate_sync_config(const SyncConfig& config);

}  // namespace edgesync
