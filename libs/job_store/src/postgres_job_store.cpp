#include "postgres_job_store.hpp"

#include <algorithm>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "sync_errors.hpp"

namespace edgesync {

using json = nlohmann::json;

namespace {

constexpr const char* kJobColumns = R"(
    job_id, seq, source_path, total_size, priority,
    COALESCE(metadata::text, '{}') AS metadata, state,
    chunk_size, chunk_count, highest_acked, upload_session_id,
    retry_count, next_eligible_at_ms, last_error, created_at_ms, updated_at_ms
)";

constexpr const char* kChunkColumns =
    "job_id, idx, byte_offset, byte_length, checksum, state, attempts";

std::string metadata_to_json(const Metadata& metadata) {
    json obj = json::object();
    for (const auto& [key, value] : metadata) {
        obj[key] = value;
    }
    return obj.dump();
}

Metadata metadata_from_json(const std::string& job_id, const std::string& text) {
    Metadata metadata;
    try {
        json obj = json::parse(text.empty() ? "{}" : text);
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                        : it.value().dump();
        }
    } catch (const json::exception& e) {
        throw StoreCorruptedError("Unreadable metadata for job " + job_id + ": " + e.what());
    }
    return metadata;
}

}  // namespace

PostgresJobStore::PostgresJobStore(std::shared_ptr<PostgresClient> db,
                                   std::shared_ptr<Clock> clock)
    : db_(std::move(db)), clock_(std::move(clock)) {}

bool PostgresJobStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto jobs = db_->execute(R"(
        CREATE TABLE IF NOT EXISTS upload_jobs (
            job_id              TEXT PRIMARY KEY,
            seq                 BIGSERIAL NOT NULL,
            source_path         TEXT NOT NULL,
            total_size          BIGINT NOT NULL CHECK (total_size > 0),
            priority            INTEGER NOT NULL,
            metadata            JSONB NOT NULL DEFAULT '{}'::jsonb,
            state               TEXT NOT NULL,
            chunk_size          BIGINT NOT NULL DEFAULT 0,
            chunk_count         BIGINT NOT NULL DEFAULT 0,
            highest_acked       BIGINT NOT NULL DEFAULT -1,
            upload_session_id   TEXT NOT NULL DEFAULT '',
            retry_count         INTEGER NOT NULL DEFAULT 0,
            next_eligible_at_ms BIGINT NOT NULL DEFAULT 0,
            last_error          TEXT NOT NULL DEFAULT '',
            created_at_ms       BIGINT NOT NULL,
            updated_at_ms       BIGINT NOT NULL
        )
    )");
    if (!jobs.ok()) {
        LOG(ERROR) << "Failed to create upload_jobs: " << jobs.error();
        return false;
    }

    auto chunks = db_->execute(R"(
        CREATE TABLE IF NOT EXISTS upload_chunks (
            job_id      TEXT NOT NULL REFERENCES upload_jobs(job_id) ON DELETE CASCADE,
            idx         BIGINT NOT NULL,
            byte_offset BIGINT NOT NULL,
            byte_length BIGINT NOT NULL,
            checksum    TEXT NOT NULL DEFAULT '',
            state       TEXT NOT NULL DEFAULT 'pending',
            attempts    INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (job_id, idx)
        )
    )");
    if (!chunks.ok()) {
        LOG(ERROR) << "Failed to create upload_chunks: " << chunks.error();
        return false;
    }

    auto index = db_->execute(
        "CREATE INDEX IF NOT EXISTS idx_upload_jobs_schedule "
        "ON upload_jobs(state, priority, seq)");
    if (!index.ok()) {
        LOG(ERROR) << "Failed to create schedule index: " << index.error();
        return false;
    }

    LOG(INFO) << "Upload job schema ready";
    return true;
}

PostgresResult PostgresJobStore::run(const std::string& query,
                                     const std::vector<std::string>& params) {
    auto result = db_->execute(query, params);
    if (!result.ok()) {
        throw StoreUnavailableError("Job store query failed: " + result.error());
    }
    return result;
}

void PostgresJobStore::commit_or_throw(PostgresTransaction& tx) {
    if (!tx.commit()) {
        throw StoreUnavailableError("Job store commit failed: " + db_->last_error());
    }
}

UploadJob PostgresJobStore::row_to_job(const PostgresRow& row) {
    UploadJob job;
    job.job_id = row.get_string("job_id");
    job.seq = row.get_int64("seq");
    job.source_path = row.get_string("source_path");
    job.total_size = static_cast<uint64_t>(row.get_int64("total_size"));
    job.priority = row.get_int("priority");
    job.metadata = metadata_from_json(job.job_id, row.get_string("metadata"));
    job.state = job_state_from_string(row.get_string("state"));
    job.chunk_size = static_cast<uint64_t>(row.get_int64("chunk_size"));
    job.chunk_count = row.get_int64("chunk_count");
    job.highest_acked = row.get_int64("highest_acked");
    job.upload_session_id = row.get_string("upload_session_id");
    job.retry_count = row.get_int("retry_count");
    job.next_eligible_at_ms = row.get_int64("next_eligible_at_ms");
    job.last_error = row.get_string("last_error");
    job.created_at_ms = row.get_int64("created_at_ms");
    job.updated_at_ms = row.get_int64("updated_at_ms");

    if (job.highest_acked >= job.chunk_count && job.chunk_count > 0) {
        throw StoreCorruptedError("Job " + job.job_id + " resume point " +
                                  std::to_string(job.highest_acked) +
                                  " beyond chunk count " +
                                  std::to_string(job.chunk_count));
    }
    return job;
}

Chunk PostgresJobStore::row_to_chunk(const PostgresRow& row) {
    Chunk chunk;
    chunk.job_id = row.get_string("job_id");
    chunk.index = row.get_int64("idx");
    chunk.offset = static_cast<uint64_t>(row.get_int64("byte_offset"));
    chunk.length = static_cast<uint64_t>(row.get_int64("byte_length"));
    chunk.checksum = row.get_string("checksum");
    chunk.state = chunk_state_from_string(row.get_string("state"));
    chunk.attempts = row.get_int("attempts");
    return chunk;
}

UploadJob PostgresJobStore::load_job_locked(const std::string& job_id, bool for_update) {
    std::string query = std::string("SELECT ") + kJobColumns +
                        " FROM upload_jobs WHERE job_id = $1";
    if (for_update) {
        query += " FOR UPDATE";
    }
    auto result = run(query, {job_id});
    if (result.num_rows() == 0) {
        throw JobNotFoundError(job_id);
    }
    return row_to_job(result.row(0));
}

Chunk PostgresJobStore::load_chunk_locked(const std::string& job_id, int64_t index) {
    auto result = run(std::string("SELECT ") + kChunkColumns +
                      " FROM upload_chunks WHERE job_id = $1 AND idx = $2::bigint FOR UPDATE",
                      {job_id, std::to_string(index)});
    if (result.num_rows() == 0) {
        throw IllegalTransitionError("Chunk index " + std::to_string(index) +
                                     " out of range for job " + job_id);
    }
    return row_to_chunk(result.row(0));
}

std::string PostgresJobStore::enqueue(const JobRequest& request) {
    UploadJob job = make_job(request, clock_->now_ms());

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(R"(
        INSERT INTO upload_jobs (
            job_id, source_path, total_size, priority, metadata, state,
            created_at_ms, updated_at_ms
        )
        VALUES ($1, $2, $3::bigint, $4::integer, $5::jsonb, $6, $7::bigint, $7::bigint)
        ON CONFLICT (job_id) DO NOTHING
    )", {
        job.job_id,
        job.source_path,
        std::to_string(job.total_size),
        std::to_string(job.priority),
        metadata_to_json(job.metadata),
        job_state_to_string(JobState::QUEUED),
        std::to_string(job.created_at_ms)
    });

    if (result.affected_rows() == 0) {
        throw InvalidJobError("Job id already exists: " + job.job_id);
    }

    LOG(INFO) << "Job " << job.job_id << " queued: " << job.source_path
              << " (" << job.total_size << " bytes, priority " << job.priority << ")";
    return job.job_id;
}

void PostgresJobStore::record_chunk_plan(const std::string& job_id, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw InvalidJobError("Chunk size must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    if (job.is_planned()) {
        throw AlreadyPlannedError("Chunk plan already fixed for job " + job_id);
    }

    auto chunks = plan_chunks(job_id, job.total_size, chunk_size);
    for (const auto& chunk : chunks) {
        run(R"(
            INSERT INTO upload_chunks (job_id, idx, byte_offset, byte_length, state)
            VALUES ($1, $2::bigint, $3::bigint, $4::bigint, 'pending')
        )", {
            job_id,
            std::to_string(chunk.index),
            std::to_string(chunk.offset),
            std::to_string(chunk.length)
        });
    }

    run(R"(
        UPDATE upload_jobs SET
            chunk_size = $2::bigint,
            chunk_count = $3::bigint,
            highest_acked = -1,
            updated_at_ms = $4::bigint
        WHERE job_id = $1
    )", {
        job_id,
        std::to_string(chunk_size),
        std::to_string(chunks.size()),
        std::to_string(clock_->now_ms())
    });

    commit_or_throw(tx);
    VLOG(1) << "Job " << job_id << " planned: " << chunks.size()
            << " chunks of " << chunk_size << " bytes";
}

void PostgresJobStore::record_upload_session(const std::string& job_id,
                                             const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(R"(
        UPDATE upload_jobs SET upload_session_id = $2, updated_at_ms = $3::bigint
        WHERE job_id = $1
    )", {job_id, session_id, std::to_string(clock_->now_ms())});

    if (result.affected_rows() == 0) {
        throw JobNotFoundError(job_id);
    }
}

void PostgresJobStore::mark_chunk_sent(const std::string& job_id, int64_t index,
                                       const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    if (!job.is_planned()) {
        throw IllegalTransitionError("Job " + job_id + " has no chunk plan");
    }
    Chunk chunk = load_chunk_locked(job_id, index);
    if (chunk.state == ChunkState::ACKED) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " is already acked");
    }
    if (index != job.highest_acked + 1) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " sent out of order");
    }

    std::string now = std::to_string(clock_->now_ms());
    run(R"(
        UPDATE upload_chunks SET state = 'sent', checksum = $3, attempts = attempts + 1
        WHERE job_id = $1 AND idx = $2::bigint
    )", {job_id, std::to_string(index), checksum});
    run("UPDATE upload_jobs SET updated_at_ms = $2::bigint WHERE job_id = $1",
        {job_id, now});

    commit_or_throw(tx);
}

void PostgresJobStore::mark_chunk_acked(const std::string& job_id, int64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    if (!job.is_planned()) {
        throw IllegalTransitionError("Job " + job_id + " has no chunk plan");
    }
    Chunk chunk = load_chunk_locked(job_id, index);
    if (chunk.state != ChunkState::SENT) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " acked while " +
                                     chunk_state_to_string(chunk.state));
    }
    if (index != job.highest_acked + 1) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " acked ahead of chunk " +
                                     std::to_string(job.highest_acked + 1));
    }

    // Chunk state and resume point move together, so a reader never sees
    // an acked chunk above a gap.
    run("UPDATE upload_chunks SET state = 'acked' WHERE job_id = $1 AND idx = $2::bigint",
        {job_id, std::to_string(index)});
    run(R"(
        UPDATE upload_jobs SET
            highest_acked = $2::bigint,
            retry_count = 0,
            updated_at_ms = $3::bigint
        WHERE job_id = $1
    )", {job_id, std::to_string(index), std::to_string(clock_->now_ms())});

    commit_or_throw(tx);
}

void PostgresJobStore::mark_chunk_rejected(const std::string& job_id, int64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    Chunk chunk = load_chunk_locked(job_id, index);
    if (chunk.state != ChunkState::SENT) {
        throw IllegalTransitionError("Chunk " + std::to_string(index) + " of job " +
                                     job_id + " rejected while " +
                                     chunk_state_to_string(chunk.state));
    }
    run("UPDATE upload_chunks SET state = 'rejected' WHERE job_id = $1 AND idx = $2::bigint",
        {job_id, std::to_string(index)});

    commit_or_throw(tx);
}

void PostgresJobStore::advance_job_state(const std::string& job_id,
                                         JobState new_state,
                                         const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    check_transition(job_id, job.state, new_state);
    if (new_state == JobState::COMPLETED && !job.all_chunks_acked()) {
        throw IllegalTransitionError("Job " + job_id +
                                     " cannot complete with unacknowledged chunks");
    }

    std::string last_error = job.last_error;
    if (!reason.empty()) {
        last_error = reason;
    } else if (new_state == JobState::COMPLETED) {
        last_error.clear();
    }

    run(R"(
        UPDATE upload_jobs SET state = $2, last_error = $3, updated_at_ms = $4::bigint
        WHERE job_id = $1
    )", {
        job_id,
        job_state_to_string(new_state),
        last_error,
        std::to_string(clock_->now_ms())
    });

    commit_or_throw(tx);
    VLOG(1) << "Job " << job_id << ": " << job_state_to_string(job.state)
            << " -> " << job_state_to_string(new_state);
}

void PostgresJobStore::schedule_retry(const std::string& job_id, int retry_count,
                                      int64_t next_eligible_at_ms,
                                      const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    check_transition(job_id, job.state, JobState::PAUSED);

    run(R"(
        UPDATE upload_jobs SET
            state = 'paused',
            retry_count = $2::integer,
            next_eligible_at_ms = $3::bigint,
            last_error = $4,
            updated_at_ms = $5::bigint
        WHERE job_id = $1
    )", {
        job_id,
        std::to_string(retry_count),
        std::to_string(next_eligible_at_ms),
        reason,
        std::to_string(clock_->now_ms())
    });

    commit_or_throw(tx);
}

void PostgresJobStore::reset_progress(const std::string& job_id, int64_t from_index) {
    from_index = std::max<int64_t>(from_index, 0);

    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job = load_job_locked(job_id, true);
    if (job.is_terminal()) {
        throw IllegalTransitionError("Cannot reset terminal job " + job_id);
    }

    run(R"(
        UPDATE upload_chunks SET state = 'pending'
        WHERE job_id = $1 AND idx >= $2::bigint
    )", {job_id, std::to_string(from_index)});

    int64_t highest = std::min(job.highest_acked, from_index - 1);
    std::string session = from_index == 0 ? "" : job.upload_session_id;
    run(R"(
        UPDATE upload_jobs SET
            highest_acked = $2::bigint,
            upload_session_id = $3,
            updated_at_ms = $4::bigint
        WHERE job_id = $1
    )", {job_id, std::to_string(highest), session, std::to_string(clock_->now_ms())});

    commit_or_throw(tx);
}

std::optional<UploadJob> PostgresJobStore::get_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(std::string("SELECT ") + kJobColumns +
                      " FROM upload_jobs WHERE job_id = $1", {job_id});
    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return row_to_job(result.row(0));
}

std::vector<Chunk> PostgresJobStore::get_chunks(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(std::string("SELECT ") + kChunkColumns +
                      " FROM upload_chunks WHERE job_id = $1 ORDER BY idx", {job_id});

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<size_t>(result.num_rows()));
    for (const auto& row : result) {
        chunks.push_back(row_to_chunk(row));
    }
    return chunks;
}

std::vector<UploadJob> PostgresJobStore::list_resumable_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(std::string("SELECT ") + kJobColumns + R"(
        FROM upload_jobs
        WHERE state IN ('queued', 'uploading', 'paused')
        ORDER BY priority ASC, seq ASC
    )");

    std::vector<UploadJob> jobs;
    jobs.reserve(static_cast<size_t>(result.num_rows()));
    for (const auto& row : result) {
        jobs.push_back(row_to_job(row));
    }
    return jobs;
}

StatusSummary PostgresJobStore::query_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = run(R"(
        SELECT state, COUNT(*) AS count, COALESCE(SUM(total_size), 0) AS total_size
        FROM upload_jobs
        GROUP BY state
    )");

    StatusSummary summary;
    for (const auto& row : result) {
        auto& totals = summary.by_state[job_state_from_string(row.get_string("state"))];
        totals.count = row.get_int64("count");
        totals.total_bytes = static_cast<uint64_t>(row.get_int64("total_size"));
    }
    return summary;
}

bool PostgresJobStore::remove_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresTransaction tx(*db_);
    if (!tx.active()) {
        throw StoreUnavailableError("Cannot begin transaction: " + db_->last_error());
    }

    UploadJob job;
    try {
        job = load_job_locked(job_id, true);
    } catch (const JobNotFoundError&) {
        return false;
    }
    if (!job.is_terminal()) {
        throw IllegalTransitionError("Cannot remove active job " + job_id);
    }

    run("DELETE FROM upload_jobs WHERE job_id = $1", {job_id});
    commit_or_throw(tx);

    LOG(INFO) << "Removed " << job_state_to_string(job.state) << " job " << job_id;
    return true;
}

}  // namespace edgesync
