#include "grpc_service_base.hpp"

#include <csignal>

#include <glog/logging.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

namespace edgesync {

std::atomic<GrpcServiceBase*> GrpcServiceBase::active_instance_{nullptr};

void GrpcServiceBase::signal_handler(int signum) {
    // shutdown() must not run on the thread blocked in wait()
    GrpcServiceBase* instance = active_instance_.load();
    if (instance) {
        instance->request_shutdown("signal " + std::to_string(signum));
    }
}

GrpcServiceBase::GrpcServiceBase(const GrpcServiceConfig& config)
    : config_(config) {
}

GrpcServiceBase::~GrpcServiceBase() {
    shutdown();
    if (shutdown_requested_.load()) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this]() { return stopped_; });
    }
    stop_watchdog();
}

void GrpcServiceBase::register_service(grpc::Service* service) {
    services_.push_back(service);
}

void GrpcServiceBase::set_watchdog(FaultCheck check) {
    fault_check_ = std::move(check);
}

void GrpcServiceBase::setup_signal_handlers() {
    // Only one instance can handle signals at a time
    GrpcServiceBase* expected = nullptr;
    if (active_instance_.compare_exchange_strong(expected, this)) {
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
    }
}

void GrpcServiceBase::build_and_start() {
    grpc::ServerBuilder builder;

    int selected_port = 0;
    builder.AddListeningPort(config_.listen_address,
                             grpc::InsecureServerCredentials(),
                             &selected_port);

    builder.SetMaxReceiveMessageSize(config_.max_message_size_bytes);
    builder.SetMaxSendMessageSize(config_.max_message_size_bytes);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, config_.keepalive_time_ms);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, config_.keepalive_timeout_ms);
    builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

    for (auto* service : services_) {
        builder.RegisterService(service);
    }
    if (config_.enable_health_check) {
        grpc::EnableDefaultHealthCheckService(true);
    }
    if (config_.enable_reflection) {
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();
    }

    server_ = builder.BuildAndStart();
    if (!server_) {
        return;
    }

    // Port 0 binds an ephemeral port; report the one chosen
    auto colon = config_.listen_address.rfind(':');
    if (selected_port > 0 && colon != std::string::npos) {
        bound_address_ = config_.listen_address.substr(0, colon + 1) +
                         std::to_string(selected_port);
    } else {
        bound_address_ = config_.listen_address;
    }
    running_.store(true);
}

bool GrpcServiceBase::start() {
    if (running_.load()) {
        LOG(WARNING) << "Server already running";
        return false;
    }
    if (services_.empty()) {
        LOG(ERROR) << "No services registered";
        return false;
    }

    setup_signal_handlers();
    build_and_start();
    if (!server_) {
        LOG(ERROR) << "Failed to bind gRPC server on " << config_.listen_address;
        return false;
    }
    set_serving(true);

    if (fault_check_) {
        watchdog_ = std::thread([this]() { watchdog_loop(); });
    }

    LOG(INFO) << "gRPC server listening on " << bound_address_;
    return true;
}

void GrpcServiceBase::watchdog_loop() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!watchdog_stop_) {
        lock.unlock();
        auto reason = fault_check_();
        lock.lock();
        if (reason) {
            fault_ = reason;
            lock.unlock();
            LOG(ERROR) << "Fault detected, shutting down: " << *reason;
            set_serving(false);
            request_shutdown(*reason);
            return;
        }
        state_cv_.wait_for(lock, config_.watchdog_interval, [this]() { return watchdog_stop_; });
    }
}

void GrpcServiceBase::stop_watchdog() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        watchdog_stop_ = true;
    }
    state_cv_.notify_all();
    if (watchdog_.joinable() && watchdog_.get_id() != std::this_thread::get_id()) {
        watchdog_.join();
    }
}

void GrpcServiceBase::set_serving(bool serving) {
    if (!config_.enable_health_check || !server_) {
        return;
    }
    if (auto* health = server_->GetHealthCheckService()) {
        health->SetServingStatus(serving);
    }
}

std::optional<std::string> GrpcServiceBase::fault() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return fault_;
}

void GrpcServiceBase::request_shutdown(const std::string& reason) {
    if (!running_.load() || shutdown_requested_.exchange(true)) {
        return;
    }
    std::thread([this, reason]() {
        LOG(INFO) << "Shutdown requested (" << reason << ")";
        shutdown();
    }).detach();
}

void GrpcServiceBase::wait() {
    if (server_) {
        server_->Wait();
    }
    if (shutdown_requested_.load()) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this]() { return stopped_; });
    }
    stop_watchdog();
}

void GrpcServiceBase::shutdown(int deadline_ms) {
    if (!running_.exchange(false)) {
        return;
    }

    LOG(INFO) << "Shutting down gRPC server...";
    set_serving(false);
    if (shutdown_callback_) {
        shutdown_callback_();
    }
    if (server_) {
        server_->Shutdown(std::chrono::system_clock::now() +
                          std::chrono::milliseconds(deadline_ms));
    }

    GrpcServiceBase* expected = this;
    active_instance_.compare_exchange_strong(expected, nullptr);

    LOG(INFO) << "gRPC server shutdown complete";
    // Notify under the lock: a waiting destructor may free the cv right after
    std::lock_guard<std::mutex> lock(state_mutex_);
    stopped_ = true;
    state_cv_.notify_all();
}

}  // namespace edgesync
