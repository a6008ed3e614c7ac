#include "sync_engine.hpp"

#include <glog/logging.h>

#include "sync_errors.hpp"

namespace edgesync {

SyncEngine::SyncEngine(SyncConfig config,
                       std::shared_ptr<JobStore> store,
                       std::shared_ptr<RemoteEndpoint> remote,
                       std::shared_ptr<BandwidthProbe> probe,
                       std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      remote_(std::move(remote)) {
    monitor_ = std::make_shared<BandwidthMonitor>(config_.bandwidth, std::move(probe), clock);
    transfer_ = std::make_shared<ChunkTransfer>(config_.transfer, store_, remote_, monitor_);
    scheduler_ = std::make_unique<SyncScheduler>(config_.scheduler, store_, transfer_, clock);

    // Uploads wait for the link instead of burning retries against it
    scheduler_->set_dispatch_gate([monitor = monitor_]() { return monitor->is_online(); });
    monitor_->set_online_listener([this]() { scheduler_->notify(); });
}

SyncEngine::~SyncEngine() {
    stop();
}

std::string SyncEngine::enqueue(const std::string& source_path,
                                int priority,
                                const Metadata& metadata,
                                const std::string& job_id) {
    JobRequest request;
    request.source_path = source_path;
    request.priority = priority;
    request.metadata = metadata;
    request.job_id = job_id;

    std::string id = store_->enqueue(request);
    LOG(INFO) << "Enqueued job " << id << ": " << source_path << " (priority " << priority
              << ")";
    scheduler_->notify();
    return id;
}

SyncStatus SyncEngine::get_status() {
    SyncStatus status;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        try {
            last_summary_ = store_->query_status();
        } catch (const StoreUnavailableError& e) {
            LOG(WARNING) << "Reporting last known status: " << e.what();
        }
        status.jobs = last_summary_;
    }
    status.current_chunk_size = monitor_->current_tier().chunk_size;
    status.online = monitor_->is_online();
    status.bandwidth_mbps = monitor_->estimate_mbps();
    return status;
}

bool SyncEngine::cancel(const std::string& job_id) {
    return scheduler_->request_cancel(job_id);
}

bool SyncEngine::remove_job(const std::string& job_id) {
    return store_->remove_job(job_id);
}

std::optional<UploadJob> SyncEngine::get_job(const std::string& job_id) {
    return store_->get_job(job_id);
}

void SyncEngine::start() {
    monitor_->start();
    scheduler_->start();
}

void SyncEngine::stop() {
    scheduler_->stop();
    monitor_->stop();
}

}  // namespace edgesync
