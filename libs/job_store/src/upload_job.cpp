#include "upload_job.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include "sync_errors.hpp"

namespace edgesync {

namespace fs = std::filesystem;

uint64_t UploadJob::acked_bytes() const {
    if (!is_planned() || highest_acked < 0) {
        return 0;
    }
    uint64_t bytes = static_cast<uint64_t>(highest_acked + 1) * chunk_size;
    return std::min(bytes, total_size);
}

const StateTotals& StatusSummary::totals(JobState state) const {
    static const StateTotals kEmpty;
    auto it = by_state.find(state);
    return it == by_state.end() ? kEmpty : it->second;
}

const char* job_state_to_string(JobState state) {
    switch (state) {
        case JobState::QUEUED: return "queued";
        case JobState::UPLOADING: return "uploading";
        case JobState::PAUSED: return "paused";
        case JobState::COMPLETED: return "completed";
        case JobState::FAILED: return "failed";
        default: return "unknown";
    }
}

JobState job_state_from_string(const std::string& value) {
    if (value == "queued") return JobState::QUEUED;
    if (value == "uploading") return JobState::UPLOADING;
    if (value == "paused") return JobState::PAUSED;
    if (value == "completed") return JobState::COMPLETED;
    if (value == "failed") return JobState::FAILED;
    throw StoreCorruptedError("Unknown job state: '" + value + "'");
}

const char* chunk_state_to_string(ChunkState state) {
    switch (state) {
        case ChunkState::PENDING: return "pending";
        case ChunkState::SENT: return "sent";
        case ChunkState::ACKED: return "acked";
        case ChunkState::REJECTED: return "rejected";
        default: return "unknown";
    }
}

ChunkState chunk_state_from_string(const std::string& value) {
    if (value == "pending") return ChunkState::PENDING;
    if (value == "sent") return ChunkState::SENT;
    if (value == "acked") return ChunkState::ACKED;
    if (value == "rejected") return ChunkState::REJECTED;
    throw StoreCorruptedError("Unknown chunk state: '" + value + "'");
}

bool is_legal_transition(JobState from, JobState to) {
    switch (from) {
        case JobState::QUEUED:
            return to == JobState::UPLOADING || to == JobState::PAUSED ||
                   to == JobState::FAILED;
        case JobState::UPLOADING:
            return to != JobState::QUEUED;
        case JobState::PAUSED:
            return to == JobState::UPLOADING || to == JobState::PAUSED ||
                   to == JobState::FAILED;
        case JobState::COMPLETED:
        case JobState::FAILED:
            return false;
    }
    return false;
}

void check_transition(const std::string& job_id, JobState from, JobState to) {
    if (!is_legal_transition(from, to)) {
        throw IllegalTransitionError(
            "Illegal transition for job " + job_id + ": " +
            job_state_to_string(from) + " -> " + job_state_to_string(to));
    }
}

int64_t chunk_count_for(uint64_t total_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<int64_t>((total_size + chunk_size - 1) / chunk_size);
}

std::vector<Chunk> plan_chunks(const std::string& job_id,
                               uint64_t total_size,
                               uint64_t chunk_size) {
    std::vector<Chunk> chunks;
    int64_t count = chunk_count_for(total_size, chunk_size);
    chunks.reserve(static_cast<size_t>(count));

    for (int64_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.job_id = job_id;
        chunk.index = i;
        chunk.offset = static_cast<uint64_t>(i) * chunk_size;
        chunk.length = std::min(chunk_size, total_size - chunk.offset);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

UploadJob make_job(const JobRequest& request, int64_t now_ms) {
    if (request.source_path.empty()) {
        throw InvalidJobError("Source path is empty");
    }
    if (request.priority < kMinPriority || request.priority > kMaxPriority) {
        throw InvalidJobError("Priority " + std::to_string(request.priority) +
                              " outside " + std::to_string(kMinPriority) + ".." +
                              std::to_string(kMaxPriority));
    }

    std::error_code ec;
    if (!fs::is_regular_file(request.source_path, ec)) {
        throw InvalidJobError("Source is not a readable file: " + request.source_path);
    }
    uint64_t size = fs::file_size(request.source_path, ec);
    if (ec) {
        throw InvalidJobError("Cannot stat source " + request.source_path +
                              ": " + ec.message());
    }
    if (size == 0) {
        throw InvalidJobError("Source is empty: " + request.source_path);
    }
    std::ifstream probe(request.source_path, std::ios::binary);
    if (!probe) {
        throw InvalidJobError("Source is not readable: " + request.source_path);
    }

    UploadJob job;
    job.job_id = request.job_id.empty() ? generate_job_id() : request.job_id;
    job.source_path = request.source_path;
    job.total_size = size;
    job.priority = request.priority;
    job.metadata = request.metadata;
    job.created_at_ms = now_ms;
    job.updated_at_ms = now_ms;
    job.state = JobState::QUEUED;
    return job;
}

std::string generate_job_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(16) << dist(gen);
    ss << std::setw(16) << dist(gen);
    return ss.str();
}

}  // namespace edgesync
