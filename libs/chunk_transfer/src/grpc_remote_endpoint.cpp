#include "grpc_remote_endpoint.hpp"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include "sync_errors.hpp"

namespace edgesync {

namespace {

void set_timeout(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

}  // namespace

bool is_transient_status(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::UNKNOWN:
            return true;
        default:
            return false;
    }
}

bool is_connectivity_status(grpc::StatusCode code) {
    return code == grpc::StatusCode::UNAVAILABLE ||
           code == grpc::StatusCode::DEADLINE_EXCEEDED;
}

std::chrono::milliseconds chunk_deadline(const RemoteEndpointConfig& config,
                                         uint64_t chunk_bytes) {
    if (config.min_link_kbps <= 0.0) {
        return config.chunk_timeout;
    }
    // kbps is bits per millisecond
    double ms = static_cast<double>(chunk_bytes) * 8.0 / config.min_link_kbps;
    auto at_min_rate = std::chrono::milliseconds(static_cast<int64_t>(std::ceil(ms)));
    return std::max(config.chunk_timeout, at_min_rate);
}

GrpcRemoteEndpoint::GrpcRemoteEndpoint(const RemoteEndpointConfig& config)
    : GrpcRemoteEndpoint(config,
                         grpc::CreateChannel(config.target, grpc::InsecureChannelCredentials())) {}

GrpcRemoteEndpoint::GrpcRemoteEndpoint(const RemoteEndpointConfig& config,
                                       std::shared_ptr<grpc::Channel> channel)
    : config_(config),
      channel_(std::move(channel)),
      stub_(upload::EdgeUploadService::NewStub(channel_)) {
    LOG(INFO) << "Remote endpoint: " << config_.target;
}

void GrpcRemoteEndpoint::check(const grpc::Status& status, const std::string& call) const {
    if (status.ok()) {
        return;
    }
    std::string message = call + " failed: [" + std::to_string(status.error_code()) + "] " +
                          status.error_message();
    if (is_connectivity_status(status.error_code())) {
        VLOG(1) << message;
        throw ConnectivityError(message);
    }
    if (is_transient_status(status.error_code())) {
        VLOG(1) << message;
        throw TransientError(message);
    }
    LOG(WARNING) << message;
    throw RemoteRejectedError(message);
}

std::string GrpcRemoteEndpoint::initiate(const std::string& job_id,
                                         uint64_t total_size,
                                         uint64_t chunk_size,
                                         int64_t chunk_count,
                                         const Metadata& metadata) {
    grpc::ClientContext context;
    set_timeout(context, config_.initiate_timeout);

    upload::InitiateRequest request;
    request.set_job_id(job_id);
    request.set_total_size(total_size);
    request.set_chunk_size(chunk_size);
    request.set_chunk_count(static_cast<uint64_t>(chunk_count));
    for (const auto& [key, value] : metadata) {
        (*request.mutable_metadata())[key] = value;
    }

    upload::InitiateResponse response;
    check(stub_->Initiate(&context, request, &response), "Initiate");

    if (response.upload_session_id().empty()) {
        throw RemoteRejectedError("Initiate returned an empty session id for job " + job_id);
    }
    return response.upload_session_id();
}

ChunkAck GrpcRemoteEndpoint::upload_chunk(const std::string& session_id,
                                          int64_t index,
                                          const std::string& data,
                                          const std::string& checksum) {
    grpc::ClientContext context;
    set_timeout(context, chunk_deadline(config_, data.size()));

    upload::UploadChunkResponse response;
    auto writer = stub_->UploadChunk(&context, &response);

    const size_t frame_bytes = static_cast<size_t>(std::max<uint64_t>(config_.frame_bytes, 1));
    size_t offset = 0;
    do {
        upload::UploadChunkFrame frame;
        if (offset == 0) {
            frame.set_upload_session_id(session_id);
            frame.set_index(index);
            frame.set_checksum_sha256(checksum);
            frame.set_chunk_length(data.size());
        }
        size_t length = std::min(frame_bytes, data.size() - offset);
        frame.set_data(data.data() + offset, length);
        if (!writer->Write(frame)) {
            // Stream broken; Finish() reports the reason
            break;
        }
        offset += length;
    } while (offset < data.size());
    if (!writer->WritesDone()) {
        VLOG(1) << "UploadChunk stream for chunk " << index << " closed early";
    }
    check(writer->Finish(), "UploadChunk");

    ChunkAck ack;
    ack.accepted = response.accepted();
    ack.error_message = response.error_message();
    return ack;
}

CompleteResult GrpcRemoteEndpoint::complete(const std::string& session_id,
                                            const std::string& merkle_root,
                                            const Metadata& metadata) {
    grpc::ClientContext context;
    set_timeout(context, config_.complete_timeout);

    upload::CompleteRequest request;
    request.set_upload_session_id(session_id);
    request.set_merkle_root(merkle_root);
    for (const auto& [key, value] : metadata) {
        (*request.mutable_metadata())[key] = value;
    }

    upload::CompleteResponse response;
    check(stub_->Complete(&context, request, &response), "Complete");

    CompleteResult result;
    result.committed = response.committed();
    result.merkle_root = response.merkle_root();
    result.error_message = response.error_message();
    return result;
}

std::optional<int64_t> GrpcRemoteEndpoint::status(const std::string& session_id) {
    grpc::ClientContext context;
    set_timeout(context, config_.status_timeout);

    upload::StatusRequest request;
    request.set_upload_session_id(session_id);

    upload::StatusResponse response;
    check(stub_->Status(&context, request, &response), "Status");

    if (!response.session_found()) {
        return std::nullopt;
    }
    return response.resume_point();
}

bool GrpcRemoteEndpoint::ping(uint64_t payload_bytes, std::chrono::milliseconds timeout) {
    grpc::ClientContext context;
    set_timeout(context, timeout);

    upload::PingRequest request;
    request.set_payload(std::string(static_cast<size_t>(payload_bytes), '\0'));

    upload::PingResponse response;
    grpc::Status status = stub_->Ping(&context, request, &response);
    if (!status.ok()) {
        VLOG(1) << "Ping failed: " << status.error_message();
        return false;
    }
    return response.received_bytes() == payload_bytes;
}

}  // namespace edgesync
