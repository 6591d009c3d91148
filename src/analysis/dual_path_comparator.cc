#include "dual_path_comparator.h"

#include <algorithm>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Tsnbench {

std::vector<double> SelectFirstArrival(const std::vector<double>& path1,
                                       const std::vector<double>& path2) {
    if (path1.size() != path2.size()) {
        throw LengthMismatch(path1.size(), path2.size());
    }
    std::vector<double> selected;
    selected.reserve(path1.size());
    for (size_t i = 0; i < path1.size(); ++i) {
        selected.push_back(std::min(path1[i], path2[i]));
    }
    return selected;
}

double ImprovementPercent(double base, double candidate) {
    if (base == 0.0) {
        return 0.0;
    }
    return (base - candidate) / base * 100.0;
}

DualPathComparison Compare(const std::vector<double>& path1, const std::vector<double>& path2) {
    const std::vector<double> selected = SelectFirstArrival(path1, path2);

    DualPathComparison cmp;
    cmp.path1_stats = LatencyStats::ComputeStats(path1);
    cmp.path2_stats = LatencyStats::ComputeStats(path2);
    cmp.selected_stats = LatencyStats::ComputeStats(selected);

    cmp.improvement_avg_pct = ImprovementPercent(cmp.path1_stats.avg, cmp.selected_stats.avg);
    cmp.improvement_p99_pct = ImprovementPercent(cmp.path1_stats.p99, cmp.selected_stats.p99);
    cmp.improvement_jitter_pct =
        ImprovementPercent(cmp.path1_stats.jitter, cmp.selected_stats.jitter);

    VLOG(1) << "Dual path comparison over " << selected.size() << " samples: avg "
            << cmp.improvement_avg_pct << "%, p99 " << cmp.improvement_p99_pct
            << "%, jitter " << cmp.improvement_jitter_pct << "%";
    return cmp;
}

} // namespace Tsnbench
