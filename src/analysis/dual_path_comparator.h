#pragma once

#include <vector>

#include "latency_stats.h"

namespace Tsnbench {

struct DualPathComparison {
    PercentileStats path1_stats;
    PercentileStats path2_stats;
    PercentileStats selected_stats;
    // Relative to path1, positive means the selected series is lower
    double improvement_avg_pct = 0.0;
    double improvement_p99_pct = 0.0;
    double improvement_jitter_pct = 0.0;
};

/**
 * Per-index minimum of two equally long latency series: the latency seen by a
 * receiver that always forwards whichever replica arrives first.
 * Throws LengthMismatch when the series differ in length.
 */
std::vector<double> SelectFirstArrival(const std::vector<double>& path1,
                                       const std::vector<double>& path2);

/**
 * Compares two paths against the first-arrival selection of both.
 * Throws LengthMismatch on unequal lengths and InsufficientData when empty.
 */
DualPathComparison Compare(const std::vector<double>& path1, const std::vector<double>& path2);

// (base - candidate) / base * 100, or 0 when base is 0
double ImprovementPercent(double base, double candidate);

} // namespace Tsnbench
