#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "upload_job.hpp"

namespace edgesync {

/// Receiver's verdict on one chunk
struct ChunkAck {
    bool accepted = false;
    std::string error_message;
};

/// Receiver's answer to complete()
struct CompleteResult {
    bool committed = false;
    std::string merkle_root;     // root computed by the receiver
    std::string error_message;
};

/**
 * Remote storage endpoint, abstracted from its transport
 *
 * Implementations throw TransientError for timeouts and unavailability
 * (retried with backoff) and RemoteRejectedError for failures retrying
 * cannot fix.
 */
class RemoteEndpoint {
public:
    virtual ~RemoteEndpoint() = default;

    /// Open an upload session for a job
    virtual std::string initiate(const std::string& job_id,
                                 uint64_t total_size,
                                 uint64_t chunk_size,
                                 int64_t chunk_count,
                                 const Metadata& metadata) = 0;

    /// Send one chunk with its checksum
    virtual ChunkAck upload_chunk(const std::string& session_id,
                                  int64_t index,
                                  const std::string& data,
                                  const std::string& checksum) = 0;

    /// Assemble the artifact and compare integrity roots
    virtual CompleteResult complete(const std::string& session_id,
                                    const std::string& merkle_root,
                                    const Metadata& metadata) = 0;

    /// Resume point the receiver holds for a session (highest contiguous
    /// index, -1 for none), nullopt if the session is unknown
    virtual std::optional<int64_t> status(const std::string& session_id) = 0;

    /// Echo payload_bytes; false if the endpoint is unreachable
    virtual bool ping(uint64_t payload_bytes, std::chrono::milliseconds timeout) = 0;
};

}  // namespace edgesync
