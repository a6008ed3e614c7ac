#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clock.hpp"

namespace edgesync {

/// One throughput measurement
struct BandwidthSample {
    double bytes_per_second = 0.0;
    int64_t timestamp_ms = 0;
    bool online = false;

    double mbps() const { return bytes_per_second * 8.0 / 1'000'000.0; }
};

/// A chunk-size bucket. A tier applies while the estimate is below
/// max_mbps; the last tier should be unbounded.
struct ChunkSizeTier {
    double max_mbps = 0.0;
    uint64_t chunk_size = 0;
};

constexpr uint64_t kMiB = 1024ULL * 1024ULL;

/// Default tier table: <1 Mbps -> 5 MiB, 1-10 Mbps -> 25 MiB, >10 Mbps -> 100 MiB
std::vector<ChunkSizeTier> default_tiers();

struct BandwidthConfig {
    std::vector<ChunkSizeTier> tiers = default_tiers();
    double hysteresis_margin = 0.20;          // fraction beyond the boundary
    int hysteresis_probes = 2;                // consecutive samples required
    double smoothing_alpha = 0.5;             // EWMA weight of the newest sample
    std::chrono::milliseconds probe_interval{300000};
    std::chrono::milliseconds offline_probe_interval{30000};   // while the link is down
    std::chrono::milliseconds probe_timeout{10000};
    // Small enough to finish within probe_timeout well below the lowest
    // tier boundary (64 KiB in 10 s is about 0.05 Mbps)
    uint64_t probe_payload_bytes = 64 * 1024;
};

/// Slowest throughput a probe of this configuration can still measure
double min_measurable_mbps(const BandwidthConfig& config);

/// Timed transfer used to measure throughput
class BandwidthProbe {
public:
    virtual ~BandwidthProbe() = default;

    /// Transfer payload_bytes within timeout. Returns the elapsed time, or
    /// nullopt if there was no connectivity.
    virtual std::optional<std::chrono::microseconds> measure(
        uint64_t payload_bytes, std::chrono::milliseconds timeout) = 0;
};

/**
 * Classifies network throughput into a chunk-size tier
 *
 * Samples are smoothed with an exponentially weighted moving average. The
 * first online sample picks the tier directly; after that a tier change
 * needs the estimate past the boundary by hysteresis_margin on
 * hysteresis_probes consecutive samples. Nothing here is persisted.
 */
class BandwidthMonitor {
public:
    BandwidthMonitor(BandwidthConfig config,
                     std::shared_ptr<BandwidthProbe> probe,
                     std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
    ~BandwidthMonitor();

    BandwidthMonitor(const BandwidthMonitor&) = delete;
    BandwidthMonitor& operator=(const BandwidthMonitor&) = delete;

    /// Take a measurement (reusing recent real-transfer timing when
    /// available) and feed it into the estimate
    BandwidthSample probe();

    /// Feed one sample into the estimate
    void add_sample(const BandwidthSample& sample);

    /// Record timing of a real chunk transfer for reuse by probe()
    void record_transfer(uint64_t bytes, std::chrono::microseconds elapsed);

    /// A transfer could not reach the receiver. The link counts as offline
    /// until a probe succeeds; the probe thread retries at
    /// offline_probe_interval.
    void mark_offline(const std::string& reason);

    /// Called (outside the monitor's lock) each time the link comes back
    /// online. Set before start().
    void set_online_listener(std::function<void()> listener);

    ChunkSizeTier current_tier() const;
    size_t current_tier_index() const;
    bool is_online() const;
    double estimate_mbps() const;

    /// Start the background probe thread
    void start();
    void stop();

private:
    void probe_loop();
    void update_estimate_locked(double mbps);
    size_t raw_tier_for(double mbps) const;
    size_t candidate_tier_for(double mbps, size_t current) const;

    BandwidthConfig config_;
    std::shared_ptr<BandwidthProbe> probe_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    bool has_estimate_ = false;
    double estimate_mbps_ = 0.0;
    bool online_ = false;
    size_t tier_index_ = 0;
    std::optional<size_t> pending_tier_;
    int pending_count_ = 0;
    std::optional<BandwidthSample> recent_transfer_;
    std::function<void()> online_listener_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread probe_thread_;
};

}  // namespace edgesync
