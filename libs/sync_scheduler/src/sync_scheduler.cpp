#include "sync_scheduler.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace edgesync {

SyncScheduler::SyncScheduler(SchedulerConfig config,
                             std::shared_ptr<JobStore> store,
                             std::shared_ptr<ChunkTransfer> transfer,
                             std::shared_ptr<Clock> clock)
    : config_(config),
      store_(std::move(store)),
      transfer_(std::move(transfer)),
      clock_(std::move(clock)),
      rng_(std::random_device{}()) {
    if (config_.max_concurrent_transfers < 1) {
        config_.max_concurrent_transfers = 1;
    }
    if (config_.max_retries < 1) {
        config_.max_retries = 1;
    }
    for (int i = 0; i < config_.max_concurrent_transfers; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    LOG(INFO) << "Sync scheduler ready: " << config_.max_concurrent_transfers
              << " transfer slot(s), max " << config_.max_retries << " retries";
}

SyncScheduler::~SyncScheduler() {
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (const auto& job_id : pending_) {
            in_flight_.erase(job_id);
        }
        pending_.clear();
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ============================================================================
// Selection
// ============================================================================

void SyncScheduler::recover_interrupted() {
    for (const auto& job : store_->list_resumable_jobs()) {
        if (job.state == JobState::UPLOADING && !is_in_flight(job.job_id)) {
            store_->advance_job_state(job.job_id, JobState::PAUSED);
            LOG(INFO) << "Recovered interrupted job " << job.job_id << " at chunk "
                      << job.highest_acked + 1 << "/" << job.chunk_count;
        }
    }
}

size_t SyncScheduler::run_cycle() {
    if (fatal_error()) {
        return 0;
    }

    std::vector<UploadJob> jobs;
    try {
        if (!recovered_) {
            recover_interrupted();
            recovered_ = true;
        }
        jobs = store_->list_resumable_jobs();
    } catch (const StoreCorruptedError& e) {
        record_fatal(e.what());
        return 0;
    } catch (const SyncError& e) {
        LOG(WARNING) << "Scheduling cycle skipped: " << e.what();
        return 0;
    }

    std::function<bool()> gate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gate = dispatch_gate_;
    }
    bool open = !gate || gate();

    int64_t now = clock_->now_ms();
    size_t dispatched = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        next_wake_ms_.reset();

        if (!open) {
            if (!gate_closed_) {
                LOG(INFO) << "Link offline, holding " << jobs.size() << " job(s)";
            }
            gate_closed_ = true;
            return 0;
        }
        if (gate_closed_) {
            LOG(INFO) << "Link online, resuming dispatch";
            gate_closed_ = false;
        }

        size_t cap = static_cast<size_t>(config_.max_concurrent_transfers);
        for (const auto& job : jobs) {
            if (in_flight_.size() >= cap) {
                break;
            }
            if (in_flight_.count(job.job_id) > 0) {
                continue;
            }

            int64_t eligible_at = job.next_eligible_at_ms;
            auto cooldown = cooldown_until_ms_.find(job.job_id);
            if (cooldown != cooldown_until_ms_.end()) {
                if (cooldown->second <= now) {
                    cooldown_until_ms_.erase(cooldown);
                } else {
                    eligible_at = std::max(eligible_at, cooldown->second);
                }
            }
            if (eligible_at > now) {
                if (!next_wake_ms_ || eligible_at < *next_wake_ms_) {
                    next_wake_ms_ = eligible_at;
                }
                continue;
            }

            in_flight_.insert(job.job_id);
            pending_.push_back(job.job_id);
            dispatched++;
            VLOG(1) << "Dispatch job " << job.job_id << " (priority " << job.priority
                    << ", " << job_state_to_string(job.state) << ")";
        }
    }
    if (dispatched > 0) {
        work_cv_.notify_all();
    }
    return dispatched;
}

void SyncScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_.empty(); });
}

// ============================================================================
// Workers
// ============================================================================

void SyncScheduler::worker_loop() {
    for (;;) {
        std::string job_id;
        std::shared_ptr<std::atomic<bool>> cancel;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
            if (stopping_) {
                return;
            }
            job_id = std::move(pending_.front());
            pending_.pop_front();

            auto& flag = cancel_flags_[job_id];
            if (!flag) {
                flag = std::make_shared<std::atomic<bool>>(false);
            }
            cancel = flag;
        }

        run_step(job_id, cancel);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancel->load()) {
                apply_late_cancel(job_id);
            }
            in_flight_.erase(job_id);
            cancel_flags_.erase(job_id);
            wake_ = true;
        }
        idle_cv_.notify_all();
        wake_cv_.notify_one();
    }
}

void SyncScheduler::run_step(const std::string& job_id,
                             std::shared_ptr<std::atomic<bool>> cancel) {
    try {
        StepResult result = transfer_->advance(job_id, cancel.get());
        VLOG(1) << "Job " << job_id << " step: " << step_result_to_string(result);
    } catch (const SyncError& e) {
        handle_failure(job_id, e.kind(), e.what());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unexpected error advancing job " << job_id << ": " << e.what();
        handle_failure(job_id, ErrorKind::TERMINAL, e.what());
    }
}

void SyncScheduler::apply_late_cancel(const std::string& job_id) {
    try {
        transfer_->cancel(job_id);
    } catch (const StoreCorruptedError& e) {
        fatal_error_ = e.what();
        running_ = false;
        LOG(ERROR) << "Job store corrupted, stopping scheduler: " << e.what();
    } catch (const SyncError& e) {
        LOG(WARNING) << "Cancel of job " << job_id << " not applied: " << e.what();
    }
}

// ============================================================================
// Failure classification
// ============================================================================

std::chrono::milliseconds SyncScheduler::next_delay(int attempt) {
    auto delay = backoff_delay(attempt, config_.backoff);
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_jitter(delay, config_.backoff, rng_);
}

void SyncScheduler::handle_failure(const std::string& job_id,
                                   ErrorKind kind,
                                   const std::string& message) {
    try {
        switch (kind) {
            case ErrorKind::TRANSIENT:
            case ErrorKind::INTEGRITY:
                handle_retryable(job_id, kind, message);
                break;
            case ErrorKind::RESOURCE:
                handle_resource(job_id, message);
                break;
            case ErrorKind::TERMINAL:
                fail_job(job_id, message);
                break;
            case ErrorKind::FATAL:
                record_fatal(message);
                break;
        }
    } catch (const StoreCorruptedError& e) {
        record_fatal(e.what());
    } catch (const StoreUnavailableError& e) {
        LOG(WARNING) << "Cannot record failure of job " << job_id << ": " << e.what();
        cool_down(job_id, backoff_delay(1, config_.backoff));
    } catch (const SyncError& e) {
        // e.g. the job was cancelled or removed concurrently
        LOG(WARNING) << "Cannot record failure of job " << job_id << ": " << e.what();
    }
}

void SyncScheduler::handle_retryable(const std::string& job_id,
                                     ErrorKind kind,
                                     const std::string& message) {
    if (kind == ErrorKind::INTEGRITY) {
        LOG(ERROR) << "Integrity failure on job " << job_id
                   << ", restarting from chunk 0: " << message;
    } else {
        LOG(WARNING) << "Transient failure on job " << job_id << ": " << message;
    }

    auto job = store_->get_job(job_id);
    if (!job || job->is_terminal()) {
        return;
    }

    int retries = job->retry_count + 1;
    if (retries >= config_.max_retries) {
        fail_job(job_id, "retry budget exhausted after " + std::to_string(retries) +
                             " attempts: " + message);
        return;
    }

    auto delay = next_delay(retries);
    store_->schedule_retry(job_id, retries, clock_->now_ms() + delay.count(), message);
    LOG(INFO) << "Job " << job_id << " retry " << retries << "/" << config_.max_retries
              << " in " << delay.count() << " ms";
}

void SyncScheduler::handle_resource(const std::string& job_id, const std::string& message) {
    auto delay = backoff_delay(1, config_.backoff);
    LOG(WARNING) << "Job " << job_id << " paused for " << delay.count()
                 << " ms, local resource unavailable: " << message;
    cool_down(job_id, delay);

    auto job = store_->get_job(job_id);
    if (job && !job->is_terminal()) {
        store_->schedule_retry(job_id, job->retry_count, clock_->now_ms() + delay.count(),
                               message);
    }
}

void SyncScheduler::fail_job(const std::string& job_id, const std::string& reason) {
    auto job = store_->get_job(job_id);
    if (!job || job->is_terminal()) {
        return;
    }
    store_->advance_job_state(job_id, JobState::FAILED, reason);
    LOG(ERROR) << "Job " << job_id << " failed: " << reason;
}

void SyncScheduler::cool_down(const std::string& job_id, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldown_until_ms_[job_id] = clock_->now_ms() + delay.count();
}

void SyncScheduler::record_fatal(const std::string& message) {
    LOG(ERROR) << "Job store corrupted, stopping scheduler: " << message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fatal_error_) {
            fatal_error_ = message;
        }
        wake_ = true;
    }
    running_ = false;
    wake_cv_.notify_all();
}

// ============================================================================
// Control loop
// ============================================================================

void SyncScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    control_thread_ = std::thread([this]() { control_loop(); });
    LOG(INFO) << "Sync scheduler started (cycle "
              << config_.cycle_interval.count() << " ms)";
}

void SyncScheduler::stop() {
    running_ = false;
    wake_cv_.notify_all();
    if (control_thread_.joinable()) {
        control_thread_.join();
        LOG(INFO) << "Sync scheduler stopped";
    }
}

void SyncScheduler::control_loop() {
    while (running_) {
        run_cycle();

        std::unique_lock<std::mutex> lock(mutex_);
        auto wait = config_.cycle_interval;
        if (next_wake_ms_) {
            auto until_eligible = std::chrono::milliseconds(
                std::max<int64_t>(*next_wake_ms_ - clock_->now_ms(), 0));
            wait = std::min(wait, until_eligible);
        }
        wake_cv_.wait_for(lock, wait, [this]() { return wake_ || !running_; });
        wake_ = false;
    }
}

void SyncScheduler::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    wake_cv_.notify_one();
}

void SyncScheduler::set_dispatch_gate(std::function<bool()> gate) {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatch_gate_ = std::move(gate);
}

// ============================================================================
// Queries and cancellation
// ============================================================================

bool SyncScheduler::request_cancel(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.count(job_id) > 0) {
        auto job = store_->get_job(job_id);
        if (!job) {
            throw JobNotFoundError(job_id);
        }
        if (job->is_terminal() || job->all_chunks_acked()) {
            return false;
        }
        auto& flag = cancel_flags_[job_id];
        if (!flag) {
            flag = std::make_shared<std::atomic<bool>>(false);
        }
        flag->store(true);
        LOG(INFO) << "Cancel requested for in-flight job " << job_id;
        return true;
    }
    // Holding the lock keeps the job from being dispatched meanwhile
    return transfer_->cancel(job_id);
}

bool SyncScheduler::is_in_flight(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(job_id) > 0;
}

size_t SyncScheduler::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::optional<std::string> SyncScheduler::fatal_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatal_error_;
}

}  // namespace edgesync
