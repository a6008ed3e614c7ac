#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.hpp"
#include "job_store.hpp"

namespace edgesync {

/// In-process job store: one table keyed by job id behind a single mutex.
/// Outlives engines that share it, which is how tests model a restart.
class MemoryJobStore : public JobStore {
public:
    explicit MemoryJobStore(std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

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

    /// Simulate a failing backing store: every call throws
    /// StoreUnavailableError while set
    void set_unavailable(bool unavailable);

private:
    struct Entry {
        UploadJob job;
        std::vector<Chunk> chunks;
    };

    Entry& find_locked(const std::string& job_id);
    Chunk& chunk_locked(Entry& entry, int64_t index);
    void check_available_locked() const;

    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    int64_t next_seq_ = 1;
    bool unavailable_ = false;
};

}  // namespace edgesync
