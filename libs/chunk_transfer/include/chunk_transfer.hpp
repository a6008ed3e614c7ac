#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "bandwidth_monitor.hpp"
#include "job_store.hpp"
#include "remote_endpoint.hpp"

namespace edgesync {

struct TransferConfig {
    int max_chunk_attempts = 5;            // sends of one chunk per step before giving up
    bool delete_source_after_sync = false;
};

/// Where a job stands in the upload protocol, derived from its persisted state
enum class TransferPhase {
    INITIATING,
    SENDING,
    FINALIZING,
    DONE,
    PAUSED,
    FAILED
};

TransferPhase transfer_phase(const UploadJob& job);
const char* transfer_phase_to_string(TransferPhase phase);

/// What one call to ChunkTransfer::advance accomplished
enum class StepResult {
    INITIATED,     // session negotiated, nothing sent yet
    CHUNK_SENT,    // one chunk acknowledged
    COMPLETED,     // remote committed the artifact
    CANCELLED,     // job moved to FAILED on request
    NOTHING        // job already terminal
};

const char* step_result_to_string(StepResult result);

/**
 * Per-job upload protocol: initiate, ordered chunk sends, finalize
 *
 * Every durable effect goes through the JobStore before or after the
 * corresponding remote call, so a crash at any point resumes from the
 * persisted resume point. Errors are thrown as SyncError subclasses and
 * classified by the caller.
 */
class ChunkTransfer {
public:
    ChunkTransfer(TransferConfig config,
                  std::shared_ptr<JobStore> store,
                  std::shared_ptr<RemoteEndpoint> remote,
                  std::shared_ptr<BandwidthMonitor> monitor);

    /**
     * Plan chunks if needed and make sure the job has a live upload session
     *
     * An existing session is reused. The first time this process sees a
     * reused session the receiver's resume point is checked: local progress
     * is rewound if the receiver holds fewer chunks, and an unknown session
     * is dropped and renegotiated from chunk 0.
     *
     * @return upload session id
     */
    std::string initiate(const std::string& job_id);

    /**
     * Transmit one chunk and wait for the receiver's verdict
     *
     * Rejected chunks are retransmitted up to max_chunk_attempts times, then
     * TransientError is thrown. Acknowledged transfers feed the bandwidth
     * monitor.
     *
     * @return number of sends it took
     */
    int send_chunk(const UploadJob& job, int64_t index,
                   const std::atomic<bool>* cancel = nullptr);

    /// Verify the Merkle root with the receiver and mark the job COMPLETED.
    /// A mismatch resets the job to chunk 0 and throws IntegrityError.
    void finalize(const UploadJob& job);

    /// Run the next protocol step for a job. A ConnectivityError also marks
    /// the link offline in the bandwidth monitor.
    StepResult advance(const std::string& job_id,
                       const std::atomic<bool>* cancel = nullptr);

    /// Fail a job on request. Returns false if the job is terminal or
    /// already finalizing.
    bool cancel(const std::string& job_id);

private:
    StepResult step(const std::string& job_id, const std::atomic<bool>* cancel);
    UploadJob load(const std::string& job_id);
    bool is_verified(const std::string& session_id);
    void reconcile_session(UploadJob& job);
    void remove_source(const UploadJob& job);

    TransferConfig config_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<RemoteEndpoint> remote_;
    std::shared_ptr<BandwidthMonitor> monitor_;

    std::mutex sessions_mutex_;
    std::set<std::string> verified_sessions_;
};

}  // namespace edgesync
