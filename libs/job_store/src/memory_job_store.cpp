#include "memory_job_store.hpp"

#include <algorithm>

#include <glog/logging.h>

#include "sync_errors.hpp"

namespace edgesync {

MemoryJobStore::MemoryJobStore(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

void MemoryJobStore::set_unavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

void MemoryJobStore::check_available_locked() const {
    if (unavailable_) {
        throw StoreUnavailableError("Job store unavailable");
    }
}

MemoryJobStore::Entry& MemoryJobStore::find_locked(const std::string& job_id) {
    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        throw JobNotFoundError(job_id);
    }
    return it->second;
}

Chunk& MemoryJobStore::chunk_locked(Entry& entry, int64_t index) {
    if (!entry.job.is_planned()) {
        throw IllegalTransitionError("Job " + entry.job.job_id + " has no chunk plan");
    }
    if (index < 0 || index >= static_cast<int64_t>(entry.chunks.size())) {
        throw IllegalTransitionError("Chunk index " + std::to_string(index) +
                                     " out of range for job " + entry.job.job_id);
    }
    return entry.chunks[static_cast<size_t>(index)];
}

std::string MemoryJobStore::enqueue(const JobRequest& request) {
    UploadJob job = make_job(request, clock_->now_ms());

    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    if (entries_.count(job.job_id) > 0) {
        throw InvalidJobError("Job id already exists: " + job.job_id);
    }
    job.seq = next_seq_++;
    std::string job_id = job.job_id;
    entries_[job_id] = Entry{std::move(job), {}};
    return job_id;
}

void MemoryJobStore::record_chunk_plan(const std::string& job_id, uint64_t chunk_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);

    if (entry.job.is_planned()) {
        throw AlreadyPlannedError("Chunk plan already fixed for job " + job_id);
    }
    if (chunk_size == 0) {
        throw InvalidJobError("Chunk size must be positive");
    }
    entry.chunks = plan_chunks(job_id, entry.job.total_size, chunk_size);
    entry.job.chunk_size = chunk_size;
    entry.job.chunk_count = static_cast<int64_t>(entry.chunks.size());
    entry.job.highest_acked = -1;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::record_upload_session(const std::string& job_id,
                                           const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);
    entry.job.upload_session_id = session_id;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::mark_chunk_sent(const std::string& job_id, int64_t index,
                                     const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);
    Chunk& chunk = chunk_locked(entry, index);

    if (chunk.state == ChunkState::ACKED) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " is already acked");
    }
    if (index != entry.job.highest_acked + 1) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " sent out of order");
    }
    chunk.state = ChunkState::SENT;
    chunk.checksum = checksum;
    chunk.attempts++;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::mark_chunk_acked(const std::string& job_id, int64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);
    Chunk& chunk = chunk_locked(entry, index);

    if (chunk.state != ChunkState::SENT) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " acked while " +
                                     chunk_state_to_string(chunk.state));
    }
    if (index != entry.job.highest_acked + 1) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " acked ahead of chunk " +
                                     std::to_string(entry.job.highest_acked + 1));
    }
    chunk.state = ChunkState::ACKED;
    entry.job.highest_acked = index;
    entry.job.retry_count = 0;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::mark_chunk_rejected(const std::string& job_id, int64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);
    Chunk& chunk = chunk_locked(entry, index);

    if (chunk.state != ChunkState::SENT) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " rejected while " +
                                     chunk_state_to_string(chunk.state));
    }
    chunk.state = ChunkState::REJECTED;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::advance_job_state(const std::string& job_id,
                                       JobState new_state,
                                       const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);

    check_transition(job_id, entry.job.state, new_state);
    if (new_state == JobState::COMPLETED && !entry.job.all_chunks_acked()) {
        throw IllegalTransitionError("Job " + job_id +
                                     " cannot complete with unacknowledged chunks");
    }
    entry.job.state = new_state;
    if (!reason.empty()) {
        entry.job.last_error = reason;
    } else if (new_state == JobState::COMPLETED) {
        entry.job.last_error.clear();
    }
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::schedule_retry(const std::string& job_id, int retry_count,
                                    int64_t next_eligible_at_ms,
                                    const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);

    check_transition(job_id, entry.job.state, JobState::PAUSED);
    entry.job.state = JobState::PAUSED;
    entry.job.retry_count = retry_count;
    entry.job.next_eligible_at_ms = next_eligible_at_ms;
    entry.job.last_error = reason;
    entry.job.updated_at_ms = clock_->now_ms();
}

void MemoryJobStore::reset_progress(const std::string& job_id, int64_t from_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    Entry& entry = find_locked(job_id);

    if (entry.job.is_terminal()) {
        throw IllegalTransitionError("Cannot reset terminal job " + job_id);
    }
    from_index = std::max<int64_t>(from_index, 0);
    for (auto& chunk : entry.chunks) {
        if (chunk.index >= from_index) {
            chunk.state = ChunkState::PENDING;
        }
    }
    entry.job.highest_acked = std::min(entry.job.highest_acked, from_index - 1);
    if (from_index == 0) {
        entry.job.upload_session_id.clear();
    }
    entry.job.updated_at_ms = clock_->now_ms();
}

std::optional<UploadJob> MemoryJobStore::get_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.job;
}

std::vector<Chunk> MemoryJobStore::get_chunks(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    return find_locked(job_id).chunks;
}

std::vector<UploadJob> MemoryJobStore::list_resumable_jobs() {
    std::vector<UploadJob> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available_locked();
        for (const auto& [id, entry] : entries_) {
            if (!entry.job.is_terminal()) {
                jobs.push_back(entry.job);
            }
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const UploadJob& a, const UploadJob& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.seq < b.seq;
    });
    return jobs;
}

StatusSummary MemoryJobStore::query_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();

    StatusSummary summary;
    for (const auto& [id, entry] : entries_) {
        auto& totals = summary.by_state[entry.job.state];
        totals.count++;
        totals.total_bytes += entry.job.total_size;
    }
    return summary;
}

bool MemoryJobStore::remove_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available_locked();
    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        return false;
    }
    if (!it->second.job.is_terminal()) {
        throw IllegalTransitionError("Cannot remove active job " + job_id);
    }
    entries_.erase(it);
    VLOG(1) << "Removed job " << job_id;
    return true;
}

}  // namespace edgesync
