#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "probe.h"

namespace Tsnbench {

struct FrameLossLoadResult {
    double offered_load_pct = 0.0;
    double target_mbps = 0.0;
    // Every trial that produced data; failed trials are left out
    std::vector<ProbeResult> trials;
    std::vector<double> trial_loss_percent;
    double avg_loss_percent = 0.0;
    double min_loss_percent = 0.0;
    double max_loss_percent = 0.0;
    double avg_actual_mbps = 0.0;
    uint64_t packets_sent = 0;
    uint64_t packets_lost = 0;
};

struct FrameLossResult {
    int frame_size = 0;
    std::vector<FrameLossLoadResult> loads;
};

std::vector<std::pair<std::string, double>> ToFields(const FrameLossLoadResult& load);

// Totals over every load: packets, worst average loss and the loads measured
std::vector<std::pair<std::string, double>> ToFields(const FrameLossResult& result);

/**
 * Measures frame loss at each offered load (percent of link_rate_mbps),
 * running `trials` probes per load at target = link_rate_mbps * load / 100.
 * @throws std::invalid_argument when link_rate_mbps <= 0, trials < 1 or a
 *         load is outside (0, 100]
 */
FrameLossResult MeasureFrameLoss(int frame_size, const std::vector<double>& offered_loads_pct,
                                 double link_rate_mbps, const RateProbe& probe, int trials);

} // namespace Tsnbench
