#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <limits>
#include <memory>

#include "endpoint_bandwidth_probe.hpp"
#include "grpc_remote_endpoint.hpp"
#include "grpc_service_base.hpp"
#include "memory_job_store.hpp"
#include "postgres_client.hpp"
#include "postgres_job_store.hpp"
#include "sync_agent_service_impl.hpp"
#include "sync_config.hpp"
#include "sync_engine.hpp"

// Control API
DEFINE_string(grpc_listen, "0.0.0.0:50071", "gRPC listen address of the agent API");

// Remote endpoint
DEFINE_string(remote_target, "localhost:50070", "EdgeUploadService address");
DEFINE_int32(initiate_timeout_ms, 30000, "Deadline of Initiate calls");
DEFINE_int32(chunk_timeout_ms, 120000, "Minimum deadline of UploadChunk calls");
DEFINE_double(min_link_kbps, 32.0, "Slowest link rate a chunk deadline must allow for");
DEFINE_int32(complete_timeout_ms, 60000, "Deadline of Complete calls");
DEFINE_int32(status_timeout_ms, 30000, "Deadline of Status calls");

// Job store
DEFINE_string(job_store, "postgres", "Job store backend: postgres or memory");
DEFINE_string(postgres_host, "localhost", "PostgreSQL host");
DEFINE_int32(postgres_port, 5432, "PostgreSQL port");
DEFINE_string(postgres_db, "edgesync", "PostgreSQL database");
DEFINE_string(postgres_user, "edgesync", "PostgreSQL user");
DEFINE_string(postgres_password, "edgesync_dev", "PostgreSQL password");

// Scheduling
DEFINE_int32(max_concurrent_transfers, 2, "Jobs uploading at the same time");
DEFINE_int32(cycle_interval_ms, 10000, "Scheduler cycle interval");
DEFINE_int32(max_retries, 6, "Transient failures before a job is failed");
DEFINE_int32(retry_base_ms, 5000, "First retry delay");
DEFINE_double(retry_factor, 2.0, "Retry delay growth factor");
DEFINE_int32(retry_cap_ms, 600000, "Maximum retry delay");
DEFINE_double(retry_jitter, 0.0, "Retry delay jitter fraction (0 disables)");

// Transfer
DEFINE_int32(max_chunk_attempts, 5, "Sends of a rejected chunk before backing off");
DEFINE_bool(delete_source_after_sync, false, "Delete local files once committed remotely");

// Bandwidth tiers
DEFINE_double(tier_low_max_mbps, 1.0, "Upper bound of the low bandwidth tier");
DEFINE_double(tier_mid_max_mbps, 10.0, "Upper bound of the middle bandwidth tier");
DEFINE_int32(tier_low_chunk_mib, 5, "Chunk size of the low tier in MiB");
DEFINE_int32(tier_mid_chunk_mib, 25, "Chunk size of the middle tier in MiB");
DEFINE_int32(tier_high_chunk_mib, 100, "Chunk size of the high tier in MiB");
DEFINE_double(hysteresis_margin, 0.20, "Fraction beyond a tier boundary needed to switch");
DEFINE_int32(hysteresis_probes, 2, "Consecutive samples needed to switch tier");
DEFINE_double(smoothing_alpha, 0.5, "Weight of the newest bandwidth sample");
DEFINE_int32(probe_interval_s, 300, "Bandwidth probe interval");
DEFINE_int32(offline_probe_interval_s, 30, "Bandwidth probe interval while offline");
DEFINE_int32(probe_timeout_ms, 10000, "Bandwidth probe deadline");
DEFINE_uint64(probe_payload_bytes, 64 * 1024, "Bandwidth probe payload size");

DEFINE_string(config_file, "", "Optional YAML file with engine settings; "
                               "flags given on the command line take precedence");

namespace {

/// Flag values apply unless a config file is used and the flag was left at
/// its default
bool use_flag(const char* name) {
    if (FLAGS_config_file.empty()) {
        return true;
    }
    gflags::CommandLineFlagInfo info;
    return gflags::GetCommandLineFlagInfo(name, &info) && !info.is_default;
}

edgesync::SyncConfig build_config() {
    using std::chrono::milliseconds;
    edgesync::SyncConfig config;

    if (!FLAGS_config_file.empty()) {
        edgesync::load_sync_config_yaml(FLAGS_config_file, config);
    }

    if (use_flag("remote_target")) config.remote.target = FLAGS_remote_target;
    if (use_flag("initiate_timeout_ms"))
        config.remote.initiate_timeout = milliseconds(FLAGS_initiate_timeout_ms);
    if (use_flag("chunk_timeout_ms"))
        config.remote.chunk_timeout = milliseconds(FLAGS_chunk_timeout_ms);
    if (use_flag("complete_timeout_ms"))
        config.remote.complete_timeout = milliseconds(FLAGS_complete_timeout_ms);
    if (use_flag("status_timeout_ms"))
        config.remote.status_timeout = milliseconds(FLAGS_status_timeout_ms);
    if (use_flag("min_link_kbps")) config.remote.min_link_kbps = FLAGS_min_link_kbps;

    auto& sched = config.scheduler;
    if (use_flag("max_concurrent_transfers"))
        sched.max_concurrent_transfers = FLAGS_max_concurrent_transfers;
    if (use_flag("cycle_interval_ms")) sched.cycle_interval = milliseconds(FLAGS_cycle_interval_ms);
    if (use_flag("max_retries")) sched.max_retries = FLAGS_max_retries;
    if (use_flag("retry_base_ms")) sched.backoff.base = milliseconds(FLAGS_retry_base_ms);
    if (use_flag("retry_factor")) sched.backoff.factor = FLAGS_retry_factor;
    if (use_flag("retry_cap_ms")) sched.backoff.cap = milliseconds(FLAGS_retry_cap_ms);
    if (use_flag("retry_jitter")) sched.backoff.jitter = FLAGS_retry_jitter;

    if (use_flag("max_chunk_attempts"))
        config.transfer.max_chunk_attempts = FLAGS_max_chunk_attempts;
    if (use_flag("delete_source_after_sync"))
        config.transfer.delete_source_after_sync = FLAGS_delete_source_after_sync;

    auto& bw = config.bandwidth;
    if (use_flag("tier_low_max_mbps") || use_flag("tier_mid_max_mbps") ||
        use_flag("tier_low_chunk_mib") || use_flag("tier_mid_chunk_mib") ||
        use_flag("tier_high_chunk_mib")) {
        bw.tiers = {
            {FLAGS_tier_low_max_mbps, static_cast<uint64_t>(FLAGS_tier_low_chunk_mib) * edgesync::kMiB},
            {FLAGS_tier_mid_max_mbps, static_cast<uint64_t>(FLAGS_tier_mid_chunk_mib) * edgesync::kMiB},
            {std::numeric_limits<double>::infinity(),
             static_cast<uint64_t>(FLAGS_tier_high_chunk_mib) * edgesync::kMiB},
        };
    }
    if (use_flag("hysteresis_margin")) bw.hysteresis_margin = FLAGS_hysteresis_margin;
    if (use_flag("hysteresis_probes")) bw.hysteresis_probes = FLAGS_hysteresis_probes;
    if (use_flag("smoothing_alpha")) bw.smoothing_alpha = FLAGS_smoothing_alpha;
    if (use_flag("probe_interval_s"))
        bw.probe_interval = std::chrono::seconds(FLAGS_probe_interval_s);
    if (use_flag("offline_probe_interval_s"))
        bw.offline_probe_interval = std::chrono::seconds(FLAGS_offline_probe_interval_s);
    if (use_flag("probe_timeout_ms")) bw.probe_timeout = milliseconds(FLAGS_probe_timeout_ms);
    if (use_flag("probe_payload_bytes")) bw.probe_payload_bytes = FLAGS_probe_payload_bytes;

    edgesync::validate_sync_config(config);
    return config;
}

std::shared_ptr<edgesync::JobStore> create_store() {
    if (FLAGS_job_store == "memory") {
        LOG(WARNING) << "Using in-memory job store, jobs will not survive a restart";
        return std::make_shared<edgesync::MemoryJobStore>();
    }
    if (FLAGS_job_store != "postgres") {
        LOG(ERROR) << "Unknown job store backend: " << FLAGS_job_store;
        return nullptr;
    }

    edgesync::PostgresConfig pg_config;
    pg_config.host = FLAGS_postgres_host;
    pg_config.port = FLAGS_postgres_port;
    pg_config.database = FLAGS_postgres_db;
    pg_config.user = FLAGS_postgres_user;
    pg_config.password = FLAGS_postgres_password;

    auto pg_client = std::make_shared<edgesync::PostgresClient>(pg_config);
    if (!pg_client->is_connected()) {
        LOG(ERROR) << "Failed to connect to PostgreSQL";
        return nullptr;
    }
    LOG(INFO) << "Connected to PostgreSQL";

    auto store = std::make_shared<edgesync::PostgresJobStore>(pg_client);
    if (!store->ensure_schema()) {
        LOG(ERROR) << "Failed to create job store schema";
        return nullptr;
    }
    return store;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    LOG(INFO) << "Edge Sync Agent starting...";
    LOG(INFO) << "  gRPC listen: " << FLAGS_grpc_listen;
    LOG(INFO) << "  Remote: " << FLAGS_remote_target;
    LOG(INFO) << "  Job store: " << FLAGS_job_store;

    edgesync::SyncConfig config;
    try {
        config = build_config();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
        return 1;
    }

    auto store = create_store();
    if (!store) {
        return 1;
    }

    auto remote = std::make_shared<edgesync::GrpcRemoteEndpoint>(config.remote);
    auto probe = std::make_shared<edgesync::EndpointBandwidthProbe>(remote);
    auto engine = std::make_shared<edgesync::SyncEngine>(config, store, remote, probe);

    auto service_impl = std::make_unique<edgesync::sync_agent::SyncAgentServiceImpl>(engine);

    edgesync::GrpcServiceConfig server_config;
    server_config.listen_address = FLAGS_grpc_listen;

    edgesync::GrpcServiceBase server(server_config);
    server.register_service(service_impl.get());
    server.set_shutdown_callback([&]() {
        service_impl->set_healthy(false);
        engine->stop();
    });
    // A corrupted store stops the scheduler; take the whole process down
    server.set_watchdog([&]() { return engine->fatal_error(); });

    engine->start();
    if (!server.start()) {
        LOG(ERROR) << "Failed to start gRPC server";
        engine->stop();
        return 1;
    }

    LOG(INFO) << "Edge Sync Agent listening on " << server.bound_address();
    server.wait();

    if (auto fault = server.fault()) {
        LOG(ERROR) << "Edge Sync Agent stopped on fatal error: " << *fault;
        return 2;
    }

    LOG(INFO) << "Edge Sync Agent shutdown complete";
    return 0;
}
