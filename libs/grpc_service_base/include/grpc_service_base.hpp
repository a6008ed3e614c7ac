#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

namespace edgesync {

/**
 * Configuration for the agent's control API server
 */
struct GrpcServiceConfig {
    std::string listen_address = "0.0.0.0:50071";
    bool enable_health_check = true;
    bool enable_reflection = true;
    int max_message_size_bytes = 4 * 1024 * 1024;
    int keepalive_time_ms = 10000;
    int keepalive_timeout_ms = 20000;
    std::chrono::milliseconds watchdog_interval{500};
};

/// Returns a reason once the process must go down, nullopt while healthy
using FaultCheck = std::function<std::optional<std::string>()>;

/**
 * Hosts the agent's gRPC services in one server
 *
 * Provides:
 * - Server lifecycle (start/wait/graceful shutdown)
 * - grpc.health.v1 status that follows set_serving()
 * - A watchdog that shuts the server down once a FaultCheck reports a fault
 * - SIGINT/SIGTERM handling
 */
class GrpcServiceBase {
public:
    explicit GrpcServiceBase(const GrpcServiceConfig& config);
    ~GrpcServiceBase();

    GrpcServiceBase(const GrpcServiceBase&) = delete;
    GrpcServiceBase& operator=(const GrpcServiceBase&) = delete;

    /// Must be called before start()
    void register_service(grpc::Service* service);

    /// Poll check every watchdog_interval while running. Must be called
    /// before start().
    void set_watchdog(FaultCheck check);

    /// Called once when shutdown starts, before the server stops
    void set_shutdown_callback(std::function<void()> callback) {
        shutdown_callback_ = std::move(callback);
    }

    /**
     * Start the server
     * Returns immediately, server runs in background
     */
    bool start();

    /**
     * Block until the server has shut down, including a shutdown started
     * by request_shutdown() or the watchdog
     */
    void wait();

    /**
     * Graceful shutdown
     * @param deadline_ms Maximum time to wait for in-flight requests
     */
    void shutdown(int deadline_ms = 5000);

    /**
     * Shut down from a thread other than the one blocked in wait(),
     * e.g. a signal or a fatal engine fault
     */
    void request_shutdown(const std::string& reason);

    /// Report SERVING / NOT_SERVING on the standard health service
    void set_serving(bool serving);

    /// Fault the watchdog shut down for, if any
    std::optional<std::string> fault() const;

    /// Actual bound address (useful when port=0)
    std::string bound_address() const { return bound_address_; }

private:
    void setup_signal_handlers();
    void build_and_start();
    void watchdog_loop();
    void stop_watchdog();

    GrpcServiceConfig config_;
    std::unique_ptr<grpc::Server> server_;
    std::vector<grpc::Service*> services_;
    std::string bound_address_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::function<void()> shutdown_callback_;

    FaultCheck fault_check_;
    std::thread watchdog_;
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::optional<std::string> fault_;
    bool watchdog_stop_ = false;
    bool stopped_ = false;

    static std::atomic<GrpcServiceBase*> active_instance_;
    static void signal_handler(int signum);
};

}  // namespace edgesync
