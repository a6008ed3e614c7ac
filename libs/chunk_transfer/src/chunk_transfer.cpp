#include "chunk_transfer.hpp"

#include <chrono>
#include <filesystem>

#include <glog/logging.h>

#include "chunk_reader.hpp"
#include "merkle.hpp"
#include "sync_errors.hpp"

namespace edgesync {

TransferPhase transfer_phase(const UploadJob& job) {
    switch (job.state) {
        case JobState::COMPLETED: return TransferPhase::DONE;
        case JobState::FAILED: return TransferPhase::FAILED;
        case JobState::PAUSED: return TransferPhase::PAUSED;
        default: break;
    }
    if (!job.is_planned() || job.upload_session_id.empty()) {
        return TransferPhase::INITIATING;
    }
    if (job.all_chunks_acked()) {
        return TransferPhase::FINALIZING;
    }
    return TransferPhase::SENDING;
}

const char* transfer_phase_to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::INITIATING: return "initiating";
        case TransferPhase::SENDING: return "sending";
        case TransferPhase::FINALIZING: return "finalizing";
        case TransferPhase::DONE: return "done";
        case TransferPhase::PAUSED: return "paused";
        case TransferPhase::FAILED: return "failed";
        default: return "unknown";
    }
}

const char* step_result_to_string(StepResult result) {
    switch (result) {
        case StepResult::INITIATED: return "initiated";
        case StepResult::CHUNK_SENT: return "chunk_sent";
        case StepResult::COMPLETED: return "completed";
        case StepResult::CANCELLED: return "cancelled";
        case StepResult::NOTHING: return "nothing";
        default: return "unknown";
    }
}

ChunkTransfer::ChunkTransfer(TransferConfig config,
                             std::shared_ptr<JobStore> store,
                             std::shared_ptr<RemoteEndpoint> remote,
                             std::shared_ptr<BandwidthMonitor> monitor)
    : config_(config),
      store_(std::move(store)),
      remote_(std::move(remote)),
      monitor_(std::move(monitor)) {
    if (config_.max_chunk_attempts < 1) {
        config_.max_chunk_attempts = 1;
    }
}

UploadJob ChunkTransfer::load(const std::string& job_id) {
    auto job = store_->get_job(job_id);
    if (!job) {
        throw JobNotFoundError(job_id);
    }
    return *job;
}

// ============================================================================
// Initiate
// ============================================================================

void ChunkTransfer::reconcile_session(UploadJob& job) {
    auto remote_point = remote_->status(job.upload_session_id);
    if (!remote_point) {
        LOG(WARNING) << "Receiver has no session " << job.upload_session_id
                     << " for job " << job.job_id << ", restarting from chunk 0";
        store_->reset_progress(job.job_id, 0);
        job = load(job.job_id);
        return;
    }
    if (*remote_point < job.highest_acked) {
        LOG(WARNING) << "Receiver holds chunks up to " << *remote_point << " of job "
                     << job.job_id << " but " << job.highest_acked
                     << " were acknowledged, rewinding";
        store_->reset_progress(job.job_id, *remote_point + 1);
        job = load(job.job_id);
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    verified_sessions_.insert(job.upload_session_id);
}

bool ChunkTransfer::is_verified(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return verified_sessions_.count(session_id) > 0;
}

std::string ChunkTransfer::initiate(const std::string& job_id) {
    UploadJob job = load(job_id);

    if (!job.is_planned()) {
        ChunkSizeTier tier = monitor_->current_tier();
        store_->record_chunk_plan(job_id, tier.chunk_size);
        job = load(job_id);
        LOG(INFO) << "Planned job " << job_id << ": " << job.chunk_count << " chunks of "
                  << job.chunk_size << " bytes";
    }

    if (!job.upload_session_id.empty()) {
        if (!is_verified(job.upload_session_id)) {
            reconcile_session(job);
        }
        if (!job.upload_session_id.empty()) {
            return job.upload_session_id;
        }
    }

    std::string session_id = remote_->initiate(job.job_id, job.total_size, job.chunk_size,
                                               job.chunk_count, job.metadata);
    store_->record_upload_session(job_id, session_id);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        verified_sessions_.insert(session_id);
    }
    LOG(INFO) << "Job " << job_id << " opened upload session " << session_id;
    return session_id;
}

// ============================================================================
// Send
// ============================================================================

int ChunkTransfer::send_chunk(const UploadJob& job, int64_t index,
                              const std::atomic<bool>* cancel) {
    auto chunks = store_->get_chunks(job.job_id);
    if (index < 0 || index >= static_cast<int64_t>(chunks.size())) {
        throw IllegalTransitionError("Chunk index " + std::to_string(index) +
                                     " out of range for job " + job.job_id);
    }
    const Chunk& chunk = chunks[static_cast<size_t>(index)];

    std::string data = read_chunk(job.source_path, chunk.offset, chunk.length, job.total_size);
    std::string checksum = sha256_hex(data);
    if (!chunk.checksum.empty() && chunk.checksum != checksum) {
        throw InvalidJobError("Source " + job.source_path + " modified during upload (chunk " +
                              std::to_string(index) + " checksum changed)");
    }

    std::string last_error;
    for (int attempt = 1; attempt <= config_.max_chunk_attempts; ++attempt) {
        if (attempt > 1 && cancel && cancel->load()) {
            throw CancelledError();
        }

        store_->mark_chunk_sent(job.job_id, index, checksum);

        auto start = std::chrono::steady_clock::now();
        ChunkAck ack = remote_->upload_chunk(job.upload_session_id, index, data, checksum);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);

        if (ack.accepted) {
            store_->mark_chunk_acked(job.job_id, index);
            monitor_->record_transfer(chunk.length, elapsed);
            VLOG(1) << "Job " << job.job_id << " chunk " << index << "/" << job.chunk_count
                    << " acked after " << attempt << " send(s)";
            return attempt;
        }

        store_->mark_chunk_rejected(job.job_id, index);
        last_error = ack.error_message;
        LOG(WARNING) << "Job " << job.job_id << " chunk " << index << " rejected (attempt "
                     << attempt << "/" << config_.max_chunk_attempts << "): " << last_error;
    }

    throw TransientError("Chunk " + std::to_string(index) + " rejected " +
                         std::to_string(config_.max_chunk_attempts) + " times: " + last_error);
}

// ============================================================================
// Finalize
// ============================================================================

void ChunkTransfer::finalize(const UploadJob& job) {
    auto chunks = store_->get_chunks(job.job_id);
    std::vector<std::string> checksums;
    checksums.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        if (chunk.state != ChunkState::ACKED) {
            throw IllegalTransitionError("Job " + job.job_id + " finalized with chunk " +
                                         std::to_string(chunk.index) + " " +
                                         chunk_state_to_string(chunk.state));
        }
        checksums.push_back(chunk.checksum);
    }

    std::string root;
    try {
        root = merkle_root(checksums);
    } catch (const std::invalid_argument& e) {
        throw StoreCorruptedError("Job " + job.job_id + " has unusable checksums: " + e.what());
    }

    CompleteResult result = remote_->complete(job.upload_session_id, root, job.metadata);
    if (!result.committed || result.merkle_root != root) {
        LOG(ERROR) << "Integrity mismatch for job " << job.job_id << ": local root " << root
                   << ", receiver root " << result.merkle_root
                   << (result.error_message.empty() ? "" : " (" + result.error_message + ")");
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            verified_sessions_.erase(job.upload_session_id);
        }
        store_->reset_progress(job.job_id, 0);
        throw IntegrityError("Merkle root mismatch: local " + root + ", remote " +
                             result.merkle_root);
    }

    store_->advance_job_state(job.job_id, JobState::COMPLETED);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        verified_sessions_.erase(job.upload_session_id);
    }
    LOG(INFO) << "Job " << job.job_id << " completed (" << job.total_size << " bytes, root "
              << root << ")";

    if (config_.delete_source_after_sync) {
        remove_source(job);
    }
}

void ChunkTransfer::remove_source(const UploadJob& job) {
    std::error_code ec;
    if (std::filesystem::remove(job.source_path, ec)) {
        LOG(INFO) << "Deleted synced source " << job.source_path;
    } else if (ec) {
        LOG(WARNING) << "Failed to delete synced source " << job.source_path << ": "
                     << ec.message();
    }
}

// ============================================================================
// Step
// ============================================================================

StepResult ChunkTransfer::advance(const std::string& job_id, const std::atomic<bool>* cancel) {
    try {
        return step(job_id, cancel);
    } catch (const ConnectivityError& e) {
        monitor_->mark_offline(e.what());
        throw;
    }
}

StepResult ChunkTransfer::step(const std::string& job_id, const std::atomic<bool>* cancel) {
    UploadJob job = load(job_id);
    VLOG(2) << "Job " << job_id << " in phase " << transfer_phase_to_string(transfer_phase(job));
    if (job.is_terminal()) {
        return StepResult::NOTHING;
    }

    if (cancel && cancel->load() && !job.all_chunks_acked()) {
        store_->advance_job_state(job_id, JobState::FAILED, "cancelled");
        LOG(INFO) << "Job " << job_id << " cancelled";
        return StepResult::CANCELLED;
    }

    if (job.state != JobState::UPLOADING) {
        store_->advance_job_state(job_id, JobState::UPLOADING);
        job.state = JobState::UPLOADING;
    }

    // A session inherited from a previous run is checked with the receiver first
    if (transfer_phase(job) == TransferPhase::INITIATING ||
        !is_verified(job.upload_session_id)) {
        initiate(job_id);
        job = load(job_id);
        if (job.highest_acked < 0 && !job.all_chunks_acked()) {
            return StepResult::INITIATED;
        }
    }

    if (transfer_phase(job) == TransferPhase::FINALIZING) {
        finalize(job);
        return StepResult::COMPLETED;
    }

    send_chunk(job, job.highest_acked + 1, cancel);
    return StepResult::CHUNK_SENT;
}

bool ChunkTransfer::cancel(const std::string& job_id) {
    UploadJob job = load(job_id);
    if (job.is_terminal() || job.all_chunks_acked()) {
        return false;
    }
    store_->advance_job_state(job_id, JobState::FAILED, "cancelled");
    LOG(INFO) << "Job " << job_id << " cancelled";
    return true;
}

}  // namespace edgesync
