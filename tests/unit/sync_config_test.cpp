/**
 * @file sync_config_test.cpp
 * @brief Unit tests for YAML engine configuration
 */

#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <stdexcept>

#include "sync_config.hpp"
#include "test_helpers.hpp"

namespace edgesync::test {

using std::chrono::milliseconds;

class SyncConfigTest : public ::testing::Test {
protected:
    void SetUp() override { init_test_logging("sync_config_test"); }

    SyncConfig config_;
};

TEST_F(SyncConfigTest, DefaultsMatchDocumentedValues) {
    EXPECT_EQ(config_.scheduler.max_concurrent_transfers, 2);
    EXPECT_EQ(config_.scheduler.max_retries, 6);
    EXPECT_EQ(config_.scheduler.backoff.base, milliseconds(5000));
    EXPECT_EQ(config_.scheduler.backoff.cap, milliseconds(600000));
    EXPECT_EQ(config_.transfer.max_chunk_attempts, 5);
    EXPECT_FALSE(config_.transfer.delete_source_after_sync);
    ASSERT_EQ(config_.bandwidth.tiers.size(), 3u);
    EXPECT_DOUBLE_EQ(config_.bandwidth.hysteresis_margin, 0.20);
    EXPECT_EQ(config_.bandwidth.hysteresis_probes, 2);
    EXPECT_EQ(config_.bandwidth.probe_payload_bytes, 64u * 1024u);
    EXPECT_DOUBLE_EQ(config_.remote.min_link_kbps, 32.0);
    EXPECT_EQ(config_.remote.frame_bytes, kMiB);
    EXPECT_NO_THROW(validate_sync_config(config_));
}

TEST_F(SyncConfigTest, OverlaysOnlyPresentKeys) {
    parse_sync_config_yaml(R"(
scheduler:
  max_concurrent_transfers: 4
  backoff:
    base_ms: 1000
    jitter: 0.1
transfer:
  delete_source_after_sync: true
remote:
  target: "uploads.example.net:443"
  chunk_timeout_ms: 30000
)", config_);

    EXPECT_EQ(config_.scheduler.max_concurrent_transfers, 4);
    EXPECT_EQ(config_.scheduler.backoff.base, milliseconds(1000));
    EXPECT_DOUBLE_EQ(config_.scheduler.backoff.jitter, 0.1);
    EXPECT_EQ(config_.scheduler.backoff.cap, milliseconds(600000));
    EXPECT_EQ(config_.scheduler.max_retries, 6);
    EXPECT_TRUE(config_.transfer.delete_source_after_sync);
    EXPECT_EQ(config_.transfer.max_chunk_attempts, 5);
    EXPECT_EQ(config_.remote.target, "uploads.example.net:443");
    EXPECT_EQ(config_.remote.chunk_timeout, milliseconds(30000));
    EXPECT_EQ(config_.remote.initiate_timeout, milliseconds(30000));
}

TEST_F(SyncConfigTest, TierTable) {
    parse_sync_config_yaml(R"(
bandwidth:
  hysteresis_probes: 3
  probe_interval_ms: 60000
  tiers:
    - {max_mbps: 2, chunk_size_mib: 4}
    - {chunk_size_mib: 64}
)", config_);

    EXPECT_EQ(config_.bandwidth.hysteresis_probes, 3);
    EXPECT_EQ(config_.bandwidth.probe_interval, milliseconds(60000));
    ASSERT_EQ(config_.bandwidth.tiers.size(), 2u);
    EXPECT_DOUBLE_EQ(config_.bandwidth.tiers[0].max_mbps, 2.0);
    EXPECT_EQ(config_.bandwidth.tiers[0].chunk_size, 4 * kMiB);
    EXPECT_TRUE(std::isinf(config_.bandwidth.tiers[1].max_mbps));
    EXPECT_EQ(config_.bandwidth.tiers[1].chunk_size, 64 * kMiB);
}

TEST_F(SyncConfigTest, EmptyTierTableRejected) {
    EXPECT_THROW(parse_sync_config_yaml("bandwidth:\n  tiers: []\n", config_),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, ZeroChunkSizeRejected) {
    EXPECT_THROW(parse_sync_config_yaml(R"(
bandwidth:
  tiers:
    - {max_mbps: 1, chunk_size_mib: 0}
    - {chunk_size_mib: 25}
)", config_),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, NonAscendingTiersRejected) {
    EXPECT_THROW(parse_sync_config_yaml(R"(
bandwidth:
  tiers:
    - {max_mbps: 10, chunk_size_mib: 25}
    - {max_mbps: 1, chunk_size_mib: 5}
    - {chunk_size_mib: 100}
)", config_),
                 std::runtime_error);
    EXPECT_THROW(parse_sync_config_yaml(R"(
bandwidth:
  tiers:
    - {max_mbps: 1, chunk_size_mib: 5}
    - {max_mbps: 1, chunk_size_mib: 25}
)", config_),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, PayloadTooLargeForSlowestTierRejected) {
    // 1 MiB in 10 s cannot measure anything under 0.84 Mbps
    config_.bandwidth.probe_payload_bytes = kMiB;
    EXPECT_THROW(validate_sync_config(config_), std::runtime_error);

    config_.bandwidth.probe_payload_bytes = 64 * 1024;
    config_.bandwidth.probe_timeout = milliseconds(0);
    EXPECT_THROW(validate_sync_config(config_), std::runtime_error);
}

TEST_F(SyncConfigTest, FrameSizeBounded) {
    config_.remote.frame_bytes = kMaxFrameBytes + 1;
    EXPECT_THROW(validate_sync_config(config_), std::runtime_error);
    config_.remote.frame_bytes = 0;
    EXPECT_THROW(validate_sync_config(config_), std::runtime_error);
    config_.remote.frame_bytes = kMaxFrameBytes;
    EXPECT_NO_THROW(validate_sync_config(config_));

    EXPECT_THROW(parse_sync_config_yaml("remote:\n  min_link_kbps: 0\n", config_),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, WrongTypeRejected) {
    EXPECT_THROW(parse_sync_config_yaml("scheduler:\n  max_retries: lots\n", config_),
                 std::runtime_error);
    EXPECT_THROW(parse_sync_config_yaml("scheduler: [unclosed\n", config_),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, LoadsFromFile) {
    TempDir dir;
    std::string path = dir.path("edgesync.yaml");
    {
        std::ofstream out(path);
        out << "scheduler:\n  max_retries: 3\n";
    }
    load_sync_config_yaml(path, config_);
    EXPECT_EQ(config_.scheduler.max_retries, 3);

    EXPECT_THROW(load_sync_config_yaml(dir.path("missing.yaml"), config_),
                 std::runtime_error);
}

}  // namespace edgesync::test
