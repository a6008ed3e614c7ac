#pragma once

#include <atomic>
#include <memory>

#include "sync-agent-service.grpc.pb.h"
#include "sync_engine.hpp"

namespace edgesync::sync_agent {

namespace proto = edgesync::agent;

/**
 * SyncAgentService gRPC implementation
 *
 * Thin adapter over SyncEngine: validates requests, converts between proto
 * and engine types and maps engine errors to gRPC status codes.
 */
class SyncAgentServiceImpl final : public proto::SyncAgentService::Service {
public:
    explicit SyncAgentServiceImpl(std::shared_ptr<SyncEngine> engine);

    // Queue a file for upload
    grpc::Status Enqueue(
        grpc::ServerContext* context,
        const proto::EnqueueRequest* request,
        proto::EnqueueResponse* response) override;

    // Per-state totals and bandwidth view
    grpc::Status GetStatus(
        grpc::ServerContext* context,
        const proto::GetStatusRequest* request,
        proto::GetStatusResponse* response) override;

    grpc::Status GetJob(
        grpc::ServerContext* context,
        const proto::GetJobRequest* request,
        proto::GetJobResponse* response) override;

    grpc::Status CancelJob(
        grpc::ServerContext* context,
        const proto::CancelJobRequest* request,
        proto::CancelJobResponse* response) override;

    // Delete a finished job's records
    grpc::Status RemoveJob(
        grpc::ServerContext* context,
        const proto::RemoveJobRequest* request,
        proto::RemoveJobResponse* response) override;

    grpc::Status Healthy(
        grpc::ServerContext* context,
        const proto::HealthyRequest* request,
        proto::HealthyResponse* response) override;

    void set_healthy(bool healthy) { is_healthy_ = healthy; }

private:
    static proto::JobState map_state(JobState state);
    static grpc::Status to_status(const SyncError& e);

    std::shared_ptr<SyncEngine> engine_;
    std::atomic<bool> is_healthy_;
};

}  // namespace edgesync::sync_agent
