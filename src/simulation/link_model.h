#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "../search/probe.h"
#include "path_latency_simulator.h"

namespace Tsnbench {

/**
 * Idealized device under test: forwards up to capacity_mbps without loss and
 * absorbs bursts up to buffer_frames. Excess traffic is dropped
 * proportionally. failure_probability makes a share of trials produce no data,
 * like a measurement tool that timed out.
 */
struct LinkModelParams {
    double capacity_mbps = 940.0;
    int buffer_frames = 1500;
    double failure_probability = 0.0;
    uint64_t seed = 1;
    // Used to turn an offered rate into a packet count
    int frame_size_bytes = 1518;
    double trial_duration_s = 1.0;
};

class LinkModel {
public:
    explicit LinkModel(const LinkModelParams& params);

    ProbeResult MeasureRate(double offered_mbps);
    ProbeResult MeasureBurst(int burst_size);

    // Probes bound to this model; the model must outlive them
    RateProbe RateProbeFn();
    BurstProbe BurstProbeFn();

    void set_frame_size(int frame_size_bytes);

    int probes_run() const { return probes_run_; }

private:
    bool TrialFails();

    LinkModelParams params_;
    std::mt19937_64 rng_;
    int probes_run_ = 0;
};

/**
 * Sends `count` frames replicated over two paths and returns the R-TAG
 * payloads in the order a receiver would capture them (by arrival time).
 * Each replica is lost independently with loss_probability.
 */
std::vector<std::vector<uint8_t>> SimulateReplicatedCapture(PathLatencySimulator& simulator,
                                                            const PathProfile& path1,
                                                            const PathProfile& path2,
                                                            size_t count, double send_interval_ms,
                                                            double loss_probability,
                                                            uint16_t stream_id);

} // namespace Tsnbench
