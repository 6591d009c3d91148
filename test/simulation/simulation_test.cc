#include <gtest/gtest.h>
#include "../../src/simulation/path_latency_simulator.h"
#include "../../src/simulation/link_model.h"
#include "../../src/analysis/sequence_analyzer.h"
#include "../../src/search/burst_capacity.h"
#include "../../src/search/rate_search.h"

#include <algorithm>
#include <stdexcept>

using namespace Tsnbench;

TEST(PathLatencySimulatorTest, SameSeedSameSeries) {
    PathProfile profile;
    PathLatencySimulator a(42);
    PathLatencySimulator b(42);
    EXPECT_EQ(a.Simulate(profile, 200), b.Simulate(profile, 200));
    EXPECT_EQ(a.seed(), 42u);

    PathLatencySimulator c(43);
    EXPECT_NE(PathLatencySimulator(42).Simulate(profile, 50), c.Simulate(profile, 50));
}

TEST(PathLatencySimulatorTest, SamplesNeverBelowFloor) {
    PathProfile noisy{0.2, 0.5, 0.15};
    PathLatencySimulator sim(7);
    std::vector<double> samples = sim.Simulate(noisy, 5000);
    ASSERT_EQ(samples.size(), 5000u);
    EXPECT_GE(*std::min_element(samples.begin(), samples.end()), 0.15);
    // With this much spread some draws must have been clamped
    EXPECT_GT(std::count(samples.begin(), samples.end(), 0.15), 0);
}

TEST(PathLatencySimulatorTest, ZeroSpreadIsConstant) {
    PathLatencySimulator sim(1);
    auto [p1, p2] = sim.SimulateDualPath({0.4, 0.0, 0.15}, {0.1, 0.0, 0.15}, 10);
    EXPECT_EQ(p1, std::vector<double>(10, 0.4));
    EXPECT_EQ(p2, std::vector<double>(10, 0.15));

    EXPECT_THROW(sim.Sample({0.4, -0.1, 0.15}), std::invalid_argument);
}

TEST(PathLatencySimulatorTest, DropProbabilityBounds) {
    PathLatencySimulator sim(3);
    EXPECT_FALSE(sim.Drop(0.0));
    EXPECT_TRUE(sim.Drop(1.0));
}

TEST(LinkModelTest, RateLossProportionalToExcess) {
    LinkModelParams params;
    params.capacity_mbps = 500.0;
    LinkModel link(params);

    ProbeResult under = link.MeasureRate(400.0);
    EXPECT_TRUE(under.success);
    EXPECT_DOUBLE_EQ(under.loss_percent, 0.0);

    ProbeResult over = link.MeasureRate(1000.0);
    EXPECT_DOUBLE_EQ(over.loss_percent, 50.0);
    EXPECT_DOUBLE_EQ(over.actual_value, 500.0);
    EXPECT_EQ(link.probes_run(), 2);
}

TEST(LinkModelTest, PacketCountsFollowFrameSize) {
    LinkModelParams params;
    params.capacity_mbps = 500.0;
    params.frame_size_bytes = 1250;
    LinkModel link(params);

    // 1000 Mbps for one second in 10000-bit frames
    ProbeResult over = link.MeasureRate(1000.0);
    EXPECT_EQ(over.packets_sent, 100000u);
    EXPECT_EQ(over.packets_lost, 50000u);

    link.set_frame_size(125);
    ProbeResult under = link.MeasureRate(100.0);
    EXPECT_EQ(under.packets_sent, 100000u);
    EXPECT_EQ(under.packets_lost, 0u);
    EXPECT_THROW(link.set_frame_size(0), std::invalid_argument);

    ProbeResult burst = link.MeasureBurst(2000);
    EXPECT_EQ(burst.packets_sent, 2000u);
    EXPECT_EQ(burst.packets_lost, 500u);
    EXPECT_DOUBLE_EQ(burst.loss_percent, 25.0);
}

TEST(LinkModelTest, RateSearchFindsCapacity) {
    LinkModelParams params;
    params.capacity_mbps = 940.0;
    LinkModel link(params);

    RateSearchResult r = FindMaxZeroLossRate(link.RateProbeFn(), 1.0, 1000.0, 0.01, 0.001, 20);
    EXPECT_TRUE(r.found);
    EXPECT_LE(r.best_rate, 940.0);
    EXPECT_GT(r.best_rate, 940.0 * 0.99);
    EXPECT_EQ(link.probes_run(), r.iterations);
}

TEST(LinkModelTest, BurstSearchFindsBuffer) {
    LinkModelParams params;
    params.buffer_frames = 1500;
    LinkModel link(params);

    BurstResult r = MaxBurstNoLoss({100, 500, 1000, 2000, 5000}, link.BurstProbeFn(), 1.0, 3);
    EXPECT_EQ(r.max_burst_no_loss, 1000);
    EXPECT_DOUBLE_EQ(r.stddev_burst, 0.0);
    EXPECT_EQ(r.frames_sent, 2000u);
    EXPECT_EQ(r.frames_lost, 500u);
}

TEST(LinkModelTest, UnreliableToolNeverInflatesResult) {
    LinkModelParams params;
    params.capacity_mbps = 600.0;
    params.failure_probability = 0.3;
    params.seed = 11;
    LinkModel link(params);

    RateSearchResult r = FindMaxZeroLossRate(link.RateProbeFn(), 1.0, 1000.0, 0.01, 0.001, 20);
    EXPECT_LE(r.best_rate, 600.0);
}

TEST(LinkModelTest, InvalidParamsRejected) {
    LinkModelParams params;
    params.capacity_mbps = 0.0;
    EXPECT_THROW(LinkModel{params}, std::invalid_argument);
    params.capacity_mbps = 100.0;
    params.buffer_frames = -1;
    EXPECT_THROW(LinkModel{params}, std::invalid_argument);
}

TEST(ReplicatedCaptureTest, LosslessCaptureHasOneDuplicatePerFrame) {
    PathLatencySimulator sim(42);
    PathProfile path1{0.40, 0.0, 0.15};
    PathProfile path2{0.45, 0.0, 0.15};

    auto capture = SimulateReplicatedCapture(sim, path1, path2, 100, 1.0, 0.0, 5);
    ASSERT_EQ(capture.size(), 200u);

    SequenceAnalysis a = AnalyzeTaggedPayloads(capture, 5);
    EXPECT_EQ(a.unique, 100u);
    EXPECT_EQ(a.duplicates, 100u);
    EXPECT_EQ(a.out_of_order, 0u);
    EXPECT_EQ(a.skipped, 0u);
    EXPECT_DOUBLE_EQ(a.elimination_efficiency_pct, 50.0);
}

TEST(ReplicatedCaptureTest, ReplicaLossReducesDuplicates) {
    PathLatencySimulator sim(9);
    PathProfile profile;
    auto capture = SimulateReplicatedCapture(sim, profile, profile, 1000, 0.1, 0.2, 1);
    EXPECT_LT(capture.size(), 2000u);

    SequenceAnalysis a = AnalyzeTaggedPayloads(capture);
    EXPECT_EQ(a.total, capture.size());
    EXPECT_LE(a.unique, 1000u);
    EXPECT_LT(a.duplicates, 1000u);
    // Frames sent 0.1 ms apart over jittery paths overtake each other
    EXPECT_GT(a.out_of_order, 0u);
}
