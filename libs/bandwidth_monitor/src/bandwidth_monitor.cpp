#include "bandwidth_monitor.hpp"

#include <algorithm>
#include <limits>

#include <glog/logging.h>

namespace edgesync {

std::vector<ChunkSizeTier> default_tiers() {
    return {
        {1.0, 5 * kMiB},
        {10.0, 25 * kMiB},
        {std::numeric_limits<double>::infinity(), 100 * kMiB},
    };
}

double min_measurable_mbps(const BandwidthConfig& config) {
    double seconds = std::chrono::duration<double>(config.probe_timeout).count();
    if (seconds <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(config.probe_payload_bytes) * 8.0 / seconds / 1'000'000.0;
}

BandwidthMonitor::BandwidthMonitor(BandwidthConfig config,
                                   std::shared_ptr<BandwidthProbe> probe,
                                   std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      probe_(std::move(probe)),
      clock_(std::move(clock)) {
    if (config_.tiers.empty()) {
        config_.tiers = default_tiers();
    }
    std::sort(config_.tiers.begin(), config_.tiers.end(),
              [](const ChunkSizeTier& a, const ChunkSizeTier& b) {
                  return a.max_mbps < b.max_mbps;
              });
    config_.hysteresis_probes = std::max(config_.hysteresis_probes, 1);
    config_.smoothing_alpha = std::clamp(config_.smoothing_alpha, 0.01, 1.0);
}

BandwidthMonitor::~BandwidthMonitor() {
    stop();
}

size_t BandwidthMonitor::raw_tier_for(double mbps) const {
    for (size_t i = 0; i < config_.tiers.size(); ++i) {
        if (mbps < config_.tiers[i].max_mbps) {
            return i;
        }
    }
    return config_.tiers.size() - 1;
}

size_t BandwidthMonitor::candidate_tier_for(double mbps, size_t current) const {
    size_t target = raw_tier_for(mbps);
    const double margin = config_.hysteresis_margin;

    // Moving up: the estimate must clear the lower bound of the target tier
    // (the upper bound of the tier below it) by the margin.
    while (target > current &&
           mbps < config_.tiers[target - 1].max_mbps * (1.0 + margin)) {
        --target;
    }
    // Moving down: the estimate must fall below the target tier's upper
    // bound by the margin.
    while (target < current &&
           mbps > config_.tiers[target].max_mbps * (1.0 - margin)) {
        ++target;
    }
    return target;
}

void BandwidthMonitor::add_sample(const BandwidthSample& sample) {
    std::function<void()> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sample.online && !online_) {
            listener = online_listener_;
        }
        online_ = sample.online;
        if (sample.online) {
            update_estimate_locked(sample.mbps());
        } else {
            VLOG(1) << "Bandwidth sample: offline";
        }
    }
    if (listener) {
        LOG(INFO) << "Link back online";
        listener();
    }
}

void BandwidthMonitor::update_estimate_locked(double mbps) {
    if (!has_estimate_) {
        has_estimate_ = true;
        estimate_mbps_ = mbps;
        tier_index_ = raw_tier_for(mbps);
        pending_tier_.reset();
        pending_count_ = 0;
        LOG(INFO) << "Initial bandwidth estimate " << mbps << " Mbps, chunk size "
                  << config_.tiers[tier_index_].chunk_size / kMiB << " MiB";
        return;
    }

    estimate_mbps_ = config_.smoothing_alpha * mbps +
                     (1.0 - config_.smoothing_alpha) * estimate_mbps_;

    size_t candidate = candidate_tier_for(estimate_mbps_, tier_index_);
    if (candidate == tier_index_) {
        pending_tier_.reset();
        pending_count_ = 0;
        return;
    }

    if (pending_tier_ && *pending_tier_ == candidate) {
        pending_count_++;
    } else {
        pending_tier_ = candidate;
        pending_count_ = 1;
    }

    if (pending_count_ >= config_.hysteresis_probes) {
        LOG(INFO) << "Bandwidth tier change: "
                  << config_.tiers[tier_index_].chunk_size / kMiB << " MiB -> "
                  << config_.tiers[candidate].chunk_size / kMiB << " MiB (estimate "
                  << estimate_mbps_ << " Mbps)";
        tier_index_ = candidate;
        pending_tier_.reset();
        pending_count_ = 0;
    }
}

void BandwidthMonitor::record_transfer(uint64_t bytes, std::chrono::microseconds elapsed) {
    if (elapsed.count() <= 0 || bytes == 0) {
        return;
    }
    BandwidthSample sample;
    sample.bytes_per_second = static_cast<double>(bytes) * 1'000'000.0 /
                              static_cast<double>(elapsed.count());
    sample.timestamp_ms = clock_->now_ms();
    sample.online = true;

    std::lock_guard<std::mutex> lock(mutex_);
    recent_transfer_ = sample;
    online_ = true;
}

void BandwidthMonitor::mark_offline(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!online_) {
            return;
        }
        online_ = false;
        recent_transfer_.reset();
    }
    LOG(WARNING) << "Link offline: " << reason;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
}

void BandwidthMonitor::set_online_listener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    online_listener_ = std::move(listener);
}

BandwidthSample BandwidthMonitor::probe() {
    BandwidthSample sample;
    sample.timestamp_ms = clock_->now_ms();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (recent_transfer_ &&
            sample.timestamp_ms - recent_transfer_->timestamp_ms <
                config_.probe_interval.count()) {
            sample = *recent_transfer_;
            recent_transfer_.reset();
        }
    }

    if (!sample.online) {
        std::optional<std::chrono::microseconds> elapsed;
        if (probe_) {
            elapsed = probe_->measure(config_.probe_payload_bytes, config_.probe_timeout);
        }
        if (elapsed && elapsed->count() > 0) {
            sample.bytes_per_second = static_cast<double>(config_.probe_payload_bytes) *
                                      1'000'000.0 / static_cast<double>(elapsed->count());
            sample.online = true;
        } else {
            LOG(WARNING) << "Bandwidth probe failed, treating link as offline";
        }
    }

    add_sample(sample);
    return sample;
}

ChunkSizeTier BandwidthMonitor::current_tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.tiers[tier_index_];
}

size_t BandwidthMonitor::current_tier_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_index_;
}

bool BandwidthMonitor::is_online() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return online_;
}

double BandwidthMonitor::estimate_mbps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return estimate_mbps_;
}

void BandwidthMonitor::start() {
    if (running_.exchange(true)) {
        LOG(WARNING) << "Bandwidth monitor already running";
        return;
    }
    probe_thread_ = std::thread([this]() { probe_loop(); });
}

void BandwidthMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (probe_thread_.joinable()) {
        probe_thread_.join();
    }
}

void BandwidthMonitor::probe_loop() {
    LOG(INFO) << "Bandwidth probe thread started (interval "
              << config_.probe_interval.count() / 1000 << "s)";
    while (running_) {
        BandwidthSample sample = probe();
        VLOG(1) << "Bandwidth probe: " << sample.mbps() << " Mbps online="
                << sample.online;

        // A mark_offline() in between shortens the wait to the offline interval
        auto interval = sample.online ? config_.probe_interval : config_.offline_probe_interval;
        auto deadline = std::chrono::steady_clock::now() + interval;
        std::unique_lock<std::mutex> lock(wake_mutex_);
        while (running_ && wake_cv_.wait_until(lock, deadline) != std::cv_status::timeout) {
            if (!is_online()) {
                deadline = std::min(deadline, std::chrono::steady_clock::now() +
                                                  config_.offline_probe_interval);
            }
        }
    }
    LOG(INFO) << "Bandwidth probe thread stopped";
}

}  // namespace edgesync
