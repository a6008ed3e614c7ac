#pragma once

#include <optional>
#include <string>
#include <vector>

#include "upload_job.hpp"

namespace edgesync {

/**
 * Durable record store for upload jobs and their chunks
 *
 * The only source of truth after a restart. All mutations of a job go
 * through these per-job atomic operations; no other component keeps an
 * authoritative copy.
 *
 * Errors:
 * - InvalidJobError: enqueue of an unreadable/empty source or bad priority
 * - AlreadyPlannedError: record_chunk_plan called twice
 * - IllegalTransitionError: job or chunk state machine violation
 * - JobNotFoundError: unknown job id
 * - StoreUnavailableError: backing store cannot be read or written
 * - StoreCorruptedError: persisted data cannot be interpreted
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    /// Persist a new QUEUED job, returns its id
    virtual std::string enqueue(const JobRequest& request) = 0;

    /// Fix chunk size and count and create the PENDING chunk rows
    virtual void record_chunk_plan(const std::string& job_id, uint64_t chunk_size) = 0;

    /// Remember the remote upload session negotiated for this job
    virtual void record_upload_session(const std::string& job_id,
                                       const std::string& session_id) = 0;

    /// PENDING/REJECTED -> SENT, stores the checksum and counts the attempt
    virtual void mark_chunk_sent(const std::string& job_id, int64_t index,
                                 const std::string& checksum) = 0;

    /// SENT -> ACKED; refused unless every lower index is already ACKED.
    /// Advances the resume point and clears the job's retry counter.
    virtual void mark_chunk_acked(const std::string& job_id, int64_t index) = 0;

    /// SENT -> REJECTED
    virtual void mark_chunk_rejected(const std::string& job_id, int64_t index) = 0;

    /// Apply a job state transition; reason is recorded as last_error
    /// when non-empty
    virtual void advance_job_state(const std::string& job_id,
                                   JobState new_state,
                                   const std::string& reason = "") = 0;

    /// Move to PAUSED until next_eligible_at_ms with the given retry count
    virtual void schedule_retry(const std::string& job_id,
                                int retry_count,
                                int64_t next_eligible_at_ms,
                                const std::string& reason) = 0;

    /// Return chunks with index >= from_index to PENDING. From 0 the upload
    /// session is forgotten as well.
    virtual void reset_progress(const std::string& job_id, int64_t from_index) = 0;

    virtual std::optional<UploadJob> get_job(const std::string& job_id) = 0;

    virtual std::vector<Chunk> get_chunks(const std::string& job_id) = 0;

    /// All non-terminal jobs ordered by priority, then enqueue order
    virtual std::vector<UploadJob> list_resumable_jobs() = 0;

    /// Per-state counts and byte totals
    virtual StatusSummary query_status() = 0;

    /// Delete a terminal job and its chunks. Returns false if the job
    /// does not exist; throws IllegalTransitionError if it is not terminal.
    virtual bool remove_job(const std::string& job_id) = 0;
};

}  // namespace edgesync
