#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.hpp"
#include "job_store.hpp"
#include "postgres_client.hpp"

namespace edgesync {

/// PostgreSQL-backed job store
///
/// Tables:
/// - upload_jobs   keyed by job_id: state, priority, size, chunk plan,
///                 session, retry bookkeeping, metadata (JSONB)
/// - upload_chunks keyed by (job_id, idx): offset, length, checksum, state
///
/// Every multi-row mutation runs in one transaction, so a crash leaves
/// either the old or the new state. The single connection is guarded by
/// a mutex; per-job calls are therefore serialized.
class PostgresJobStore : public JobStore {
public:
    PostgresJobStore(std::shared_ptr<PostgresClient> db,
                     std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    /// Create tables and indexes if missing. Returns false on failure.
    bool ensure_schema();

    std::string enqueue(const JobRequest& request) override;
    void record_chunk_plan(const std::string& job_id, uint64_t chunk_size) override;
    void record_upload_session(const std::string& job_id,
                               const std::string& session_id) override;
    void mark_chunk_sent(const std::string& job_id, int64_t index,
                         const std::string& checksum) override;
    void mark_chunk_acked(const std::string& job_id, int64_t index) override;
    void mark_chunk_rejected(const std::string& job_id, int64_t index) override;
    void advance_job_state(const std::string& job_id, JobState new_state,
                           const std::string& reason = "") override;
    void schedule_retry(const std::string& job_id, int retry_count,
                        int64_t next_eligible_at_ms,
                        const std::string& reason) override;
    void reset_progress(const std::string& job_id, int64_t from_index) override;
    std::optional<UploadJob> get_job(const std::string& job_id) override;
    std::vector<Chunk> get_chunks(const std::string& job_id) override;
    std::vector<UploadJob> list_resumable_jobs() override;
    StatusSummary query_status() override;
    bool remove_job(const std::string& job_id) override;

private:
    /// Run a statement, throwing StoreUnavailableError on failure
    PostgresResult run(const std::string& query,
                       const std::vector<std::string>& params = {});

    /// Load a job row under FOR UPDATE (inside a transaction) or plain
    UploadJob load_job_locked(const std::string& job_id, bool for_update);

    /// Load one chunk row under FOR UPDATE
    Chunk load_chunk_locked(const std::string& job_id, int64_t index);

    void commit_or_throw(PostgresTransaction& tx);

    static UploadJob row_to_job(const PostgresRow& row);
    static Chunk row_to_chunk(const PostgresRow& row);

    std::shared_ptr<PostgresClient> db_;
    std::shared_ptr<Clock> clock_;
    std::mutex mutex_;
};

}  // namespace edgesync
