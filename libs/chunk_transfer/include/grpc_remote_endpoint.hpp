#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "edge-upload-service.grpc.pb.h"
#include "remote_endpoint.hpp"

namespace edgesync {

/// Deadlines for each remote call
struct RemoteEndpointConfig {
    std::string target = "localhost:50070";
    std::chrono::milliseconds initiate_timeout{30000};
    std::chrono::milliseconds chunk_timeout{120000};   // floor, see chunk_deadline
    std::chrono::milliseconds complete_timeout{60000};
    std::chrono::milliseconds status_timeout{30000};
    double min_link_kbps = 32.0;                       // slowest link a chunk must survive
    uint64_t frame_bytes = 1024 * 1024;                // UploadChunk stream frame size
};

/// True for gRPC codes a later retry may resolve
bool is_transient_status(grpc::StatusCode code);

/// True for codes that mean the receiver was not reached at all
bool is_connectivity_status(grpc::StatusCode code);

/// Deadline for sending chunk_bytes: the time the chunk takes at
/// min_link_kbps, never less than chunk_timeout
std::chrono::milliseconds chunk_deadline(const RemoteEndpointConfig& config,
                                         uint64_t chunk_bytes);

/**
 * RemoteEndpoint over the EdgeUploadService gRPC API
 *
 * Every call carries its own deadline. Unreachable or timed out calls become
 * ConnectivityError, other transient status codes TransientError, anything
 * else RemoteRejectedError. Chunks are streamed in frames of frame_bytes.
 */
class GrpcRemoteEndpoint : public RemoteEndpoint {
public:
    explicit GrpcRemoteEndpoint(const RemoteEndpointConfig& config);
    GrpcRemoteEndpoint(const RemoteEndpointConfig& config,
                       std::shared_ptr<grpc::Channel> channel);

    std::string initiate(const std::string& job_id,
                         uint64_t total_size,
                         uint64_t chunk_size,
                         int64_t chunk_count,
                         const Metadata& metadata) override;

    ChunkAck upload_chunk(const std::string& session_id,
                          int64_t index,
                          const std::string& data,
                          const std::string& checksum) override;

    CompleteResult complete(const std::string& session_id,
                            const std::string& merkle_root,
                            const Metadata& metadata) override;

    std::optional<int64_t> status(const std::string& session_id) override;

    bool ping(uint64_t payload_bytes, std::chrono::milliseconds timeout) override;

private:
    void check(const grpc::Status& status, const std::string& call) const;

    RemoteEndpointConfig config_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<upload::EdgeUploadService::Stub> stub_;
};

}  // namespace edgesync
