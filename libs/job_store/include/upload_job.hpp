#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace edgesync {

/// Persisted job state
enum class JobState {
    QUEUED = 0,
    UPLOADING = 1,
    PAUSED = 2,
    COMPLETED = 3,
    FAILED = 4
};

/// Per-chunk acknowledgment state
enum class ChunkState {
    PENDING = 0,
    SENT = 1,
    ACKED = 2,
    REJECTED = 3
};

using Metadata = std::map<std::string, std::string>;

constexpr int kMinPriority = 1;   // urgent
constexpr int kMaxPriority = 10;  // batch

/// One artifact queued for transfer
struct UploadJob {
    std::string job_id;
    std::string source_path;
    uint64_t total_size = 0;
    int priority = 5;
    Metadata metadata;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
    int64_t seq = 0;                 // enqueue order, FIFO tie-breaker

    JobState state = JobState::QUEUED;

    // Chunk plan, fixed once (chunk_size == 0 means not planned yet)
    uint64_t chunk_size = 0;
    int64_t chunk_count = 0;
    int64_t highest_acked = -1;      // resume point, -1 if nothing acked

    std::string upload_session_id;   // empty until initiated

    int retry_count = 0;
    int64_t next_eligible_at_ms = 0;
    std::string last_error;

    bool is_planned() const { return chunk_size > 0; }
    bool is_terminal() const {
        return state == JobState::COMPLETED || state == JobState::FAILED;
    }
    bool all_chunks_acked() const {
        return is_planned() && highest_acked + 1 == chunk_count;
    }
    /// Bytes covered by contiguously acknowledged chunks
    uint64_t acked_bytes() const;
};

/// One contiguous byte range of a job
struct Chunk {
    std::string job_id;
    int64_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    std::string checksum;            // hex SHA-256, empty until first send
    ChunkState state = ChunkState::PENDING;
    int attempts = 0;                // number of transmissions
};

/// Caller's request to queue a file
struct JobRequest {
    std::string source_path;
    int priority = 5;
    Metadata metadata;
    std::string job_id;              // optional, generated when empty
};

/// Aggregate per state, for reporting
struct StateTotals {
    int64_t count = 0;
    uint64_t total_bytes = 0;
};

struct StatusSummary {
    std::map<JobState, StateTotals> by_state;

    const StateTotals& totals(JobState state) const;
};

const char* job_state_to_string(JobState state);
JobState job_state_from_string(const std::string& value);

const char* chunk_state_to_string(ChunkState state);
ChunkState chunk_state_from_string(const std::string& value);

/// True if the job state machine allows from -> to
bool is_legal_transition(JobState from, JobState to);

/// Throws IllegalTransitionError if from -> to is not allowed
void check_transition(const std::string& job_id, JobState from, JobState to);

/// Number of chunks needed to cover total_size
int64_t chunk_count_for(uint64_t total_size, uint64_t chunk_size);

/// Build the chunk partition of [0, total_size)
std::vector<Chunk> plan_chunks(const std::string& job_id,
                               uint64_t total_size,
                               uint64_t chunk_size);

/// Validate a request against the file system and build the QUEUED job.
/// Throws InvalidJobError.
UploadJob make_job(const JobRequest& request, int64_t now_ms);

/// Random 32 hex character job id
std::string generate_job_id();

}  // namespace edgesync
