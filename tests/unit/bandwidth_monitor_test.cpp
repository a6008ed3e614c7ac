/**
 * @file bandwidth_monitor_test.cpp
 * @brief Unit tests for bandwidth tier selection and hysteresis
 */

#include <gtest/gtest.h>

#include <limits>

#include "bandwidth_monitor.hpp"
#include "test_helpers.hpp"

namespace edgesync::test {

class BandwidthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging("bandwidth_monitor_test");
        clock_ = std::make_shared<ManualClock>();
        probe_ = std::make_shared<FixedBandwidthProbe>();
    }

    std::unique_ptr<BandwidthMonitor> make_monitor(double alpha = 1.0) {
        BandwidthConfig config;
        config.smoothing_alpha = alpha;
        config.probe_payload_bytes = 100000;
        return std::make_unique<BandwidthMonitor>(config, probe_, clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<FixedBandwidthProbe> probe_;
};

// =============================================================================
// Tier selection
// =============================================================================

TEST_F(BandwidthMonitorTest, SlowLinkUsesSmallestTier) {
    auto monitor = make_monitor(0.5);
    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(0.6));
    monitor->add_sample(sample_mbps(0.4));

    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
    EXPECT_TRUE(monitor->is_online());
}

TEST_F(BandwidthMonitorTest, FirstSamplePicksTierDirectly) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(50.0));
    EXPECT_EQ(monitor->current_tier().chunk_size, 100 * kMiB);
    EXPECT_EQ(monitor->current_tier_index(), 2u);
}

TEST_F(BandwidthMonitorTest, DefaultTierBeforeAnySample) {
    auto monitor = make_monitor();
    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
    EXPECT_FALSE(monitor->is_online());
}

TEST_F(BandwidthMonitorTest, TiersSortedByBoundary) {
    BandwidthConfig config;
    config.smoothing_alpha = 1.0;
    config.tiers = {
        {std::numeric_limits<double>::infinity(), 50 * kMiB},
        {2.0, 2 * kMiB},
    };
    BandwidthMonitor monitor(config, probe_, clock_);
    monitor.add_sample(sample_mbps(1.0));
    EXPECT_EQ(monitor.current_tier().chunk_size, 2 * kMiB);
}

// =============================================================================
// Hysteresis
// =============================================================================

TEST_F(BandwidthMonitorTest, SingleSampleAcrossBoundaryDoesNotFlip) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(1.3));
    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
}

TEST_F(BandwidthMonitorTest, ConsecutiveSamplesPastMarginFlip) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(1.3));
    monitor->add_sample(sample_mbps(1.3));
    EXPECT_EQ(monitor->current_tier().chunk_size, 25 * kMiB);
}

TEST_F(BandwidthMonitorTest, SamplesInsideMarginNeverFlip) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(0.5));
    for (int i = 0; i < 5; ++i) {
        monitor->add_sample(sample_mbps(1.1));
    }
    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
}

TEST_F(BandwidthMonitorTest, InterruptedStreakStartsOver) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(1.3));
    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(1.3));
    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
}

TEST_F(BandwidthMonitorTest, DowngradeNeedsMarginBelowBoundary) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(5.0));
    ASSERT_EQ(monitor->current_tier().chunk_size, 25 * kMiB);

    monitor->add_sample(sample_mbps(0.9));
    monitor->add_sample(sample_mbps(0.9));
    EXPECT_EQ(monitor->current_tier().chunk_size, 25 * kMiB);

    monitor->add_sample(sample_mbps(0.5));
    monitor->add_sample(sample_mbps(0.5));
    EXPECT_EQ(monitor->current_tier().chunk_size, 5 * kMiB);
}

TEST_F(BandwidthMonitorTest, SmoothingDampensSpikes) {
    auto monitor = make_monitor(0.5);
    monitor->add_sample(sample_mbps(1.0));
    monitor->add_sample(sample_mbps(3.0));
    EXPECT_DOUBLE_EQ(monitor->estimate_mbps(), 2.0);
}

// =============================================================================
// Probing
// =============================================================================

TEST_F(BandwidthMonitorTest, ProbeMeasuresThroughput) {
    auto monitor = make_monitor();
    probe_->mbps = 8.0;
    BandwidthSample sample = monitor->probe();

    EXPECT_TRUE(sample.online);
    EXPECT_NEAR(sample.mbps(), 8.0, 0.01);
    EXPECT_EQ(probe_->calls, 1);
    EXPECT_EQ(monitor->current_tier().chunk_size, 25 * kMiB);
}

TEST_F(BandwidthMonitorTest, FailedProbeReportsOffline) {
    auto monitor = make_monitor();
    monitor->add_sample(sample_mbps(5.0));
    probe_->online = false;

    BandwidthSample sample = monitor->probe();
    EXPECT_FALSE(sample.online);
    EXPECT_FALSE(monitor->is_online());
    // tier is kept for when the link returns
    EXPECT_EQ(monitor->current_tier().chunk_size, 25 * kMiB);
}

TEST_F(BandwidthMonitorTest, RecentTransferReplacesProbe) {
    auto monitor = make_monitor();
    // 1 MB in one second = 8 Mbps
    monitor->record_transfer(1'000'000, std::chrono::seconds(1));

    BandwidthSample sample = monitor->probe();
    EXPECT_EQ(probe_->calls, 0);
    EXPECT_NEAR(sample.mbps(), 8.0, 0.01);

    // consumed, the next probe measures again
    monitor->probe();
    EXPECT_EQ(probe_->calls, 1);
}

TEST_F(BandwidthMonitorTest, StaleTransferIgnored) {
    auto monitor = make_monitor();
    monitor->record_transfer(1'000'000, std::chrono::seconds(1));
    clock_->advance(std::chrono::minutes(10));

    monitor->probe();
    EXPECT_EQ(probe_->calls, 1);
}

TEST_F(BandwidthMonitorTest, DefaultPayloadMeasuresSubMegabitLinks) {
    BandwidthConfig config;
    EXPECT_LT(min_measurable_mbps(config), 0.1);
    EXPECT_LT(min_measurable_mbps(config), config.tiers.front().max_mbps);

    probe_->mbps = 0.1;
    BandwidthMonitor monitor(config, probe_, clock_);
    BandwidthSample sample = monitor.probe();
    EXPECT_TRUE(sample.online);
    EXPECT_NEAR(sample.mbps(), 0.1, 0.001);
    EXPECT_EQ(monitor.current_tier().chunk_size, 5 * kMiB);
}

TEST_F(BandwidthMonitorTest, OversizedPayloadTimesOutOnSlowLink) {
    BandwidthConfig config;
    config.probe_payload_bytes = kMiB;
    EXPECT_GT(min_measurable_mbps(config), 0.5);

    probe_->mbps = 0.5;
    BandwidthMonitor monitor(config, probe_, clock_);
    EXPECT_FALSE(monitor.probe().online);
    EXPECT_FALSE(monitor.is_online());
}

// =============================================================================
// Link state
// =============================================================================

TEST_F(BandwidthMonitorTest, MarkOfflineDropsRecentTransfer) {
    auto monitor = make_monitor();
    monitor->record_transfer(1'000'000, std::chrono::seconds(1));
    ASSERT_TRUE(monitor->is_online());

    monitor->mark_offline("Initiate failed: unreachable");
    EXPECT_FALSE(monitor->is_online());

    // the next probe measures instead of trusting the last transfer
    probe_->online = false;
    EXPECT_FALSE(monitor->probe().online);
    EXPECT_EQ(probe_->calls, 1);
}

TEST_F(BandwidthMonitorTest, OnlineListenerFiresOnReconnectOnly) {
    auto monitor = make_monitor();
    int fired = 0;
    monitor->set_online_listener([&fired]() { fired++; });

    monitor->probe();
    EXPECT_EQ(fired, 1);
    monitor->probe();
    EXPECT_EQ(fired, 1);

    monitor->mark_offline("link lost");
    monitor->mark_offline("link lost");
    EXPECT_EQ(fired, 1);

    monitor->probe();
    EXPECT_EQ(fired, 2);
    EXPECT_TRUE(monitor->is_online());
}

}  // namespace edgesync::test
