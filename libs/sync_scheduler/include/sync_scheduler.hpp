#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "backoff.hpp"
#include "chunk_transfer.hpp"
#include "clock.hpp"
#include "job_store.hpp"
#include "sync_errors.hpp"

namespace edgesync {

struct SchedulerConfig {
    int max_concurrent_transfers = 2;
    std::chrono::milliseconds cycle_interval{10000};
    BackoffPolicy backoff;
    int max_retries = 6;   // transient failures before a job is FAILED
};

/**
 * Control loop that decides which job advances next
 *
 * Each cycle selects up to max_concurrent_transfers eligible jobs ordered by
 * priority then enqueue order and hands one protocol step per job to a
 * fixed worker pool. A job is never advanced by two workers at once.
 * Failures are classified here:
 * - TRANSIENT / INTEGRITY: retry_count + 1, PAUSED until the backoff expires,
 *   FAILED once max_retries is reached
 * - RESOURCE: PAUSED without spending retry budget
 * - TERMINAL: FAILED with the error as reason
 * - FATAL: the loop stops and fatal_error() is set
 *
 * Usable without start(): tests drive it with run_cycle() and wait_idle().
 */
class SyncScheduler {
public:
    SyncScheduler(SchedulerConfig config,
                  std::shared_ptr<JobStore> store,
                  std::shared_ptr<ChunkTransfer> transfer,
                  std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /// One selection pass. Returns the number of steps dispatched.
    size_t run_cycle();

    /// Block until no step is queued or running
    void wait_idle();

    /// Start the control loop thread
    void start();

    /// Stop the control loop; running steps finish first
    void stop();

    /// Wake the control loop early (new work, a freed slot, link back up)
    void notify();

    /**
     * Only dispatch while gate() returns true
     *
     * Checked once per cycle after the job list is read, so store faults
     * still surface while the gate is closed. Jobs keep their state and
     * retry budget. Set before start().
     */
    void set_dispatch_gate(std::function<bool()> gate);

    /**
     * Cancel a job
     *
     * A job that is not in flight is failed immediately. An in-flight job is
     * flagged and stops at its next chunk boundary.
     *
     * @return false if the job is already terminal or finalizing
     * @throws JobNotFoundError
     */
    bool request_cancel(const std::string& job_id);

    bool is_in_flight(const std::string& job_id) const;
    size_t in_flight_count() const;

    /// Set once a corrupted store stopped the loop
    std::optional<std::string> fatal_error() const;

private:
    void control_loop();
    void worker_loop();
    void recover_interrupted();
    void run_step(const std::string& job_id, std::shared_ptr<std::atomic<bool>> cancel);
    void apply_late_cancel(const std::string& job_id);   // mutex_ held
    void handle_failure(const std::string& job_id, ErrorKind kind, const std::string& message);
    void handle_retryable(const std::string& job_id, ErrorKind kind, const std::string& message);
    void handle_resource(const std::string& job_id, const std::string& message);
    void fail_job(const std::string& job_id, const std::string& reason);
    void cool_down(const std::string& job_id, std::chrono::milliseconds delay);
    void record_fatal(const std::string& message);
    std::chrono::milliseconds next_delay(int attempt);

    SchedulerConfig config_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<ChunkTransfer> transfer_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::condition_variable wake_cv_;

    std::deque<std::string> pending_;                     // dispatched, waiting for a worker
    std::set<std::string> in_flight_;                     // pending or running
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> cancel_flags_;
    std::map<std::string, int64_t> cooldown_until_ms_;    // store-down pauses, not persisted
    std::optional<int64_t> next_wake_ms_;
    std::optional<std::string> fatal_error_;
    std::function<bool()> dispatch_gate_;
    bool gate_closed_ = false;
    bool recovered_ = false;
    bool wake_ = false;
    bool stopping_ = false;
    std::mt19937_64 rng_;

    std::atomic<bool> running_{false};
    std::thread control_thread_;
    std::vector<std::thread> workers_;
};

}  // namespace edgesync
