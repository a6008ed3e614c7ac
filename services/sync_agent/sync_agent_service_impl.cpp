#include "sync_agent_service_impl.hpp"

#include <glog/logging.h>

#include "sync_errors.hpp"

namespace edgesync::sync_agent {

SyncAgentServiceImpl::SyncAgentServiceImpl(std::shared_ptr<SyncEngine> engine)
    : engine_(std::move(engine)),
      is_healthy_(true) {}

proto::JobState SyncAgentServiceImpl::map_state(JobState state) {
    switch (state) {
        case JobState::QUEUED: return proto::JOB_STATE_QUEUED;
        case JobState::UPLOADING: return proto::JOB_STATE_UPLOADING;
        case JobState::PAUSED: return proto::JOB_STATE_PAUSED;
        case JobState::COMPLETED: return proto::JOB_STATE_COMPLETED;
        case JobState::FAILED: return proto::JOB_STATE_FAILED;
        default: return proto::JOB_STATE_QUEUED;
    }
}

grpc::Status SyncAgentServiceImpl::to_status(const SyncError& e) {
    switch (e.kind()) {
        case ErrorKind::TERMINAL:
            if (dynamic_cast<const JobNotFoundError*>(&e)) {
                return grpc::Status(grpc::NOT_FOUND, e.what());
            }
            if (dynamic_cast<const IllegalTransitionError*>(&e)) {
                return grpc::Status(grpc::FAILED_PRECONDITION, e.what());
            }
            return grpc::Status(grpc::INVALID_ARGUMENT, e.what());
        case ErrorKind::RESOURCE:
        case ErrorKind::TRANSIENT:
            return grpc::Status(grpc::UNAVAILABLE, e.what());
        default:
            return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::Enqueue(
    grpc::ServerContext* context,
    const proto::EnqueueRequest* request,
    proto::EnqueueResponse* response) {

    if (request->source_path().empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "source_path is required");
    }

    try {
        int priority = request->priority() == 0 ? 5 : request->priority();
        Metadata metadata;
        for (const auto& entry : request->metadata()) {
            metadata[entry.first] = entry.second;
        }

        response->set_job_id(
            engine_->enqueue(request->source_path(), priority, metadata, request->job_id()));
        return grpc::Status::OK;

    } catch (const SyncError& e) {
        LOG(WARNING) << "Enqueue of " << request->source_path() << " refused: " << e.what();
        return to_status(e);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Enqueue failed: " << e.what();
        return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::GetStatus(
    grpc::ServerContext* context,
    const proto::GetStatusRequest* request,
    proto::GetStatusResponse* response) {

    try {
        SyncStatus status = engine_->get_status();

        for (JobState state : {JobState::QUEUED, JobState::UPLOADING, JobState::PAUSED,
                               JobState::COMPLETED, JobState::FAILED}) {
            const auto& totals = status.jobs.totals(state);
            auto* entry = response->add_states();
            entry->set_state(map_state(state));
            entry->set_count(totals.count);
            entry->set_total_bytes(totals.total_bytes);
        }
        response->set_current_chunk_size(status.current_chunk_size);
        response->set_online(status.online);
        response->set_bandwidth_mbps(status.bandwidth_mbps);
        return grpc::Status::OK;

    } catch (const std::exception& e) {
        LOG(ERROR) << "GetStatus failed: " << e.what();
        return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::GetJob(
    grpc::ServerContext* context,
    const proto::GetJobRequest* request,
    proto::GetJobResponse* response) {

    if (request->job_id().empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "job_id is required");
    }

    try {
        auto job = engine_->get_job(request->job_id());
        if (!job) {
            return grpc::Status(grpc::NOT_FOUND, "Job not found: " + request->job_id());
        }

        auto* j = response->mutable_job();
        j->set_job_id(job->job_id);
        j->set_source_path(job->source_path);
        j->set_total_size(job->total_size);
        j->set_priority(job->priority);
        j->set_state(map_state(job->state));
        j->set_chunk_size(job->chunk_size);
        j->set_chunk_count(job->chunk_count);
        j->set_highest_acked(job->highest_acked);
        j->set_retry_count(job->retry_count);
        j->set_next_eligible_at_ms(job->next_eligible_at_ms);
        j->set_last_error(job->last_error);
        j->set_created_at_ms(job->created_at_ms);
        for (const auto& [key, value] : job->metadata) {
            (*j->mutable_metadata())[key] = value;
        }
        return grpc::Status::OK;

    } catch (const SyncError& e) {
        return to_status(e);
    } catch (const std::exception& e) {
        LOG(ERROR) << "GetJob failed: " << e.what();
        return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::CancelJob(
    grpc::ServerContext* context,
    const proto::CancelJobRequest* request,
    proto::CancelJobResponse* response) {

    if (request->job_id().empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "job_id is required");
    }

    try {
        response->set_cancelled(engine_->cancel(request->job_id()));
        return grpc::Status::OK;

    } catch (const SyncError& e) {
        LOG(WARNING) << "CancelJob " << request->job_id() << ": " << e.what();
        return to_status(e);
    } catch (const std::exception& e) {
        LOG(ERROR) << "CancelJob failed: " << e.what();
        return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::RemoveJob(
    grpc::ServerContext* context,
    const proto::RemoveJobRequest* request,
    proto::RemoveJobResponse* response) {

    if (request->job_id().empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "job_id is required");
    }

    try {
        response->set_removed(engine_->remove_job(request->job_id()));
        return grpc::Status::OK;

    } catch (const SyncError& e) {
        LOG(WARNING) << "RemoveJob " << request->job_id() << ": " << e.what();
        return to_status(e);
    } catch (const std::exception& e) {
        LOG(ERROR) << "RemoveJob failed: " << e.what();
        return grpc::Status(grpc::INTERNAL, e.what());
    }
}

grpc::Status SyncAgentServiceImpl::Healthy(
    grpc::ServerContext* context,
    const proto::HealthyRequest* request,
    proto::HealthyResponse* response) {

    response->set_is_healthy(is_healthy_ && !engine_->fatal_error());
    return grpc::Status::OK;
}

}  // namespace edgesync::sync_agent
