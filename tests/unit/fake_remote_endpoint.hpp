/**
 * @file fake_remote_endpoint.hpp
 * @brief In-memory receiver with scripted faults for transfer tests
 *
 * Verifies chunk checksums, accepts chunks strictly in order (a resend of
 * an already held chunk is accepted again), assembles the artifact and
 * computes the Merkle root on complete() from the data it holds.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "merkle.hpp"
#include "remote_endpoint.hpp"
#include "sync_errors.hpp"

namespace edgesync::test {

class FakeRemoteEndpoint : public RemoteEndpoint {
public:
    struct Session {
        std::string job_id;
        uint64_t total_size = 0;
        uint64_t chunk_size = 0;
        int64_t chunk_count = 0;
        Metadata metadata;
        std::vector<std::string> chunks;      // data by index
        int64_t resume_point = -1;
        bool committed = false;
        Metadata committed_metadata;
    };

    // ------------------------------------------------------------------
    // RemoteEndpoint
    // ------------------------------------------------------------------

    std::string initiate(const std::string& job_id,
                         uint64_t total_size,
                         uint64_t chunk_size,
                         int64_t chunk_count,
                         const Metadata& metadata) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail_locked("Initiate");
        std::string session_id = "session-" + std::to_string(++session_counter_);
        Session session;
        session.job_id = job_id;
        session.total_size = total_size;
        session.chunk_size = chunk_size;
        session.chunk_count = chunk_count;
        session.metadata = metadata;
        session.chunks.resize(static_cast<size_t>(chunk_count));
        sessions_[session_id] = session;
        initiate_order_.push_back(job_id);
        return session_id;
    }

    ChunkAck upload_chunk(const std::string& session_id,
                          int64_t index,
                          const std::string& data,
                          const std::string& checksum) override {
        wait_while_held();
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail_locked("UploadChunk");

        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw RemoteRejectedError("unknown session " + session_id);
        }
        Session& session = it->second;
        const std::string& job_id = session.job_id;
        sends_[job_id][index]++;
        observed_[job_id].push_back(index);

        auto reject = rejections_[job_id].find(index);
        if (reject != rejections_[job_id].end() && reject->second > 0) {
            reject->second--;
            return ChunkAck{false, "simulated rejection"};
        }
        if (sha256_hex(data) != checksum) {
            return ChunkAck{false, "checksum mismatch"};
        }
        if (index > session.resume_point + 1 || index >= session.chunk_count) {
            return ChunkAck{false, "out of order"};
        }
        session.chunks[static_cast<size_t>(index)] = data;
        if (index == session.resume_point + 1) {
            session.resume_point = index;
        }
        bytes_received_ += data.size();
        return ChunkAck{true, ""};
    }

    CompleteResult complete(const std::string& session_id,
                            const std::string& merkle_root,
                            const Metadata& metadata) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail_locked("Complete");

        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw RemoteRejectedError("unknown session " + session_id);
        }
        Session& session = it->second;
        if (session.resume_point + 1 != session.chunk_count) {
            return CompleteResult{false, "", "missing chunks"};
        }
        std::vector<std::string> checksums;
        for (const auto& chunk : session.chunks) {
            checksums.push_back(sha256_hex(chunk));
        }
        std::string root = edgesync::merkle_root(checksums);
        if (root != merkle_root) {
            return CompleteResult{false, root, "merkle root mismatch"};
        }
        session.committed = true;
        session.committed_metadata = metadata;
        return CompleteResult{true, root, ""};
    }

    std::optional<int64_t> status(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail_locked("Status");
        status_calls_++;
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second.resume_point;
    }

    bool ping(uint64_t payload_bytes, std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return online_;
    }

    // ------------------------------------------------------------------
    // Scripting
    // ------------------------------------------------------------------

    /// Reject chunk index of job_id the next times sends
    void reject_chunk(const std::string& job_id, int64_t index, int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejections_[job_id][index] = times;
    }

    /// Next calls calls throw TransientError (deadline exceeded)
    void fail_next_calls(int calls) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_calls_ = calls;
    }

    /// upload_chunk() blocks until release_uploads()
    void hold_uploads() {
        std::lock_guard<std::mutex> lock(hold_mutex_);
        holding_ = true;
    }

    void release_uploads() {
        {
            std::lock_guard<std::mutex> lock(hold_mutex_);
            holding_ = false;
        }
        hold_cv_.notify_all();
    }

    /// Block until count upload_chunk() calls are parked by hold_uploads()
    void wait_for_held(int count) {
        std::unique_lock<std::mutex> lock(hold_mutex_);
        hold_cv_.wait(lock, [&]() { return held_ >= count; });
    }

    /// Every call throws ConnectivityError until cleared
    void set_unreachable(bool unreachable) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_ = unreachable;
        online_ = !unreachable;
    }

    /// Flip one stored byte of a received chunk
    void corrupt_chunk(const std::string& session_id, int64_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& data = sessions_.at(session_id).chunks.at(static_cast<size_t>(index));
        if (!data.empty()) {
            data[0] = static_cast<char>(data[0] ^ 0x01);
        }
    }

    /// Receiver lost the session (e.g. its own restart)
    void forget_session(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    }

    /// Receiver lost chunks above keep_through
    void truncate_session(const std::string& session_id, int64_t keep_through) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& session = sessions_.at(session_id);
        session.resume_point = std::min(session.resume_point, keep_through);
    }

    // ------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------

    int sends(const std::string& job_id, int64_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto job = sends_.find(job_id);
        if (job == sends_.end()) {
            return 0;
        }
        auto it = job->second.find(index);
        return it == job->second.end() ? 0 : it->second;
    }

    /// Chunk indices in the order the receiver saw them
    std::vector<int64_t> observed_indices(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = observed_.find(job_id);
        return it == observed_.end() ? std::vector<int64_t>{} : it->second;
    }

    std::vector<std::string> initiate_order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initiate_order_;
    }

    int initiate_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(initiate_order_.size());
    }

    int status_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_calls_;
    }

    std::optional<Session> session(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Concatenated data of a session
    std::string assembled(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string result;
        for (const auto& chunk : sessions_.at(session_id).chunks) {
            result += chunk;
        }
        return result;
    }

    uint64_t bytes_received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_received_;
    }

private:
    void maybe_fail_locked(const std::string& call) {
        if (unreachable_) {
            throw ConnectivityError(call + " failed: endpoint unreachable");
        }
        if (failing_calls_ > 0) {
            failing_calls_--;
            throw TransientError(call + " failed: deadline exceeded");
        }
    }

    void wait_while_held() {
        std::unique_lock<std::mutex> lock(hold_mutex_);
        if (!holding_) {
            return;
        }
        held_++;
        hold_cv_.notify_all();
        hold_cv_.wait(lock, [this]() { return !holding_; });
    }

    std::mutex hold_mutex_;
    std::condition_variable hold_cv_;
    bool holding_ = false;
    int held_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    int session_counter_ = 0;
    std::vector<std::string> initiate_order_;
    std::map<std::string, std::map<int64_t, int>> sends_;
    std::map<std::string, std::vector<int64_t>> observed_;
    std::map<std::string, std::map<int64_t, int>> rejections_;
    int failing_calls_ = 0;
    bool unreachable_ = false;
    bool online_ = true;
    int status_calls_ = 0;
    uint64_t bytes_received_ = 0;
};

}  // namespace edgesync::test
