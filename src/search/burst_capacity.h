#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "probe.h"

namespace Tsnbench {

struct BurstTrial {
    int max_burst_no_loss = 0;
    // Every candidate passed
    bool exhausted = false;
    // The probe that ended the scan; left default when exhausted
    ProbeResult first_loss;
};

struct BurstResult {
    int frame_size = 0;
    // Worst trial: a burst claim has to hold on every run, not just a lucky one
    int max_burst_no_loss = 0;
    std::vector<int> trial_values;
    std::vector<BurstTrial> trials;
    // Frames of the burst that ended the worst trial, 0 when it passed every candidate
    uint64_t frames_sent = 0;
    uint64_t frames_lost = 0;
    double avg_burst = 0.0;
    double stddev_burst = 0.0;
    // Some trial passed every candidate, so the real capacity may be larger
    bool candidates_exhausted = false;
};

struct BurstSearchParams {
    std::vector<int> candidate_sizes{100, 500, 1000, 2000, 5000, 10000};
    double loss_threshold = 1.0;
    int trials = 3;
    int frame_size = 0;
    // Trials are independent; only enable when the probe is thread-safe
    bool parallel_trials = false;
};

class BurstCapacityEngine {
public:
    explicit BurstCapacityEngine(BurstProbe probe);

    /**
     * Runs params.trials independent scans over the ascending candidate sizes.
     * Each scan stops at the first size whose loss reaches the threshold (or
     * whose probe fails) and yields the largest size that passed before it.
     * Candidates must be positive and strictly ascending; a repeated size is
     * rejected rather than probed twice.
     * @throws std::invalid_argument on empty, non-positive, repeated or
     *         descending candidates, or trials < 1
     */
    BurstResult MaxBurstNoLoss(const BurstSearchParams& params) const;

    // One scan over the candidates
    BurstTrial RunTrial(const std::vector<int>& candidate_sizes, double loss_threshold) const;

private:
    BurstProbe probe_;
};

BurstResult MaxBurstNoLoss(const std::vector<int>& candidate_sizes, const BurstProbe& probe,
                           double loss_threshold, int trials);

std::vector<std::pair<std::string, double>> ToFields(const BurstResult& result);

} // namespace Tsnbench
