#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "bandwidth_monitor.hpp"
#include "chunk_transfer.hpp"
#include "clock.hpp"
#include "job_store.hpp"
#include "remote_endpoint.hpp"
#include "sync_config.hpp"
#include "sync_scheduler.hpp"

namespace edgesync {

/// Snapshot reported by SyncEngine::get_status
struct SyncStatus {
    StatusSummary jobs;
    uint64_t current_chunk_size = 0;
    bool online = false;
    double bandwidth_mbps = 0.0;
};

/**
 * Owns the store, remote endpoint, bandwidth monitor, transfer protocol and
 * scheduler, and exposes the operations callers use
 *
 * Nothing is dispatched until the monitor has seen the link online, and
 * dispatch pauses whenever a probe or a transfer finds it offline.
 */
class SyncEngine {
public:
    SyncEngine(SyncConfig config,
               std::shared_ptr<JobStore> store,
               std::shared_ptr<RemoteEndpoint> remote,
               std::shared_ptr<BandwidthProbe> probe,
               std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// Queue a file. Throws InvalidJobError or StoreUnavailableError.
    std::string enqueue(const std::string& source_path,
                        int priority = 5,
                        const Metadata& metadata = {},
                        const std::string& job_id = "");

    /// Per-state totals plus the bandwidth view. Falls back to the last
    /// successful store read while the store is unavailable.
    SyncStatus get_status();

    bool cancel(const std::string& job_id);
    bool remove_job(const std::string& job_id);
    std::optional<UploadJob> get_job(const std::string& job_id);

    void start();
    void stop();

    std::optional<std::string> fatal_error() const { return scheduler_->fatal_error(); }

    SyncScheduler& scheduler() { return *scheduler_; }
    BandwidthMonitor& monitor() { return *monitor_; }
    JobStore& store() { return *store_; }

private:
    SyncConfig config_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<RemoteEndpoint> remote_;
    std::shared_ptr<BandwidthMonitor> monitor_;
    std::shared_ptr<ChunkTransfer> transfer_;
    std::unique_ptr<SyncScheduler> scheduler_;

    std::mutex status_mutex_;
    StatusSummary last_summary_;
};

}  // namespace edgesync
