#include "frame_loss.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include <glog/logging.h>

namespace Tsnbench {

FrameLossResult MeasureFrameLoss(int frame_size, const std::vector<double>& offered_loads_pct,
                                 double link_rate_mbps, const RateProbe& probe, int trials) {
    if (!(link_rate_mbps > 0.0)) {
        throw std::invalid_argument("Link rate must be positive");
    }
    if (trials < 1) {
        throw std::invalid_argument("Frame loss test needs at least one trial");
    }
    for (double load : offered_loads_pct) {
        if (!(load > 0.0 && load <= 100.0)) {
            throw std::invalid_argument("Offered load out of range: " + std::to_string(load));
        }
    }

    FrameLossResult result;
    result.frame_size = frame_size;
    result.loads.reserve(offered_loads_pct.size());

    for (double load : offered_loads_pct) {
        FrameLossLoadResult lr;
        lr.offered_load_pct = load;
        lr.target_mbps = link_rate_mbps * load / 100.0;
        VLOG(1) << "Frame loss at " << load << "% load (" << lr.target_mbps << " Mbps)";

        for (int t = 0; t < trials; ++t) {
            const ProbeResult pr = InvokeProbe(probe, lr.target_mbps, "Frame loss");
            if (!pr.success) {
                continue;
            }
            lr.trial_loss_percent.push_back(pr.loss_percent);
            lr.packets_sent += pr.packets_sent;
            lr.packets_lost += pr.packets_lost;
            lr.avg_actual_mbps += pr.actual_value;
            lr.trials.push_back(pr);
        }

        if (!lr.trial_loss_percent.empty()) {
            const auto& losses = lr.trial_loss_percent;
            lr.avg_loss_percent = std::accumulate(losses.begin(), losses.end(), 0.0) /
                                  static_cast<double>(losses.size());
            lr.min_loss_percent = *std::min_element(losses.begin(), losses.end());
            lr.max_loss_percent = *std::max_element(losses.begin(), losses.end());
            lr.avg_actual_mbps /= static_cast<double>(losses.size());
            LOG(INFO) << frame_size << " bytes @ " << load << "%: avg loss "
                      << lr.avg_loss_percent << "%, min " << lr.min_loss_percent
                      << "%, max " << lr.max_loss_percent << "% (" << lr.packets_lost << "/"
                      << lr.packets_sent << " packets)";
        } else {
            LOG(WARNING) << "No usable trial at " << load << "% load for " << frame_size
                         << " byte frames";
        }
        result.loads.push_back(std::move(lr));
    }
    return result;
}

std::vector<std::pair<std::string, double>> ToFields(const FrameLossLoadResult& load) {
    return {
        {"offered_load_pct", load.offered_load_pct},
        {"target_mbps", load.target_mbps},
        {"actual_mbps", load.avg_actual_mbps},
        {"avg_loss_percent", load.avg_loss_percent},
        {"min_loss_percent", load.min_loss_percent},
        {"max_loss_percent", load.max_loss_percent},
        {"packets_sent", static_cast<double>(load.packets_sent)},
        {"packets_lost", static_cast<double>(load.packets_lost)},
        {"trials", static_cast<double>(load.trials.size())},
    };
}

std::vector<std::pair<std::string, double>> ToFields(const FrameLossResult& result) {
    uint64_t sent = 0;
    uint64_t lost = 0;
    double worst_avg = 0.0;
    for (const auto& load : result.loads) {
        sent += load.packets_sent;
        lost += load.packets_lost;
        worst_avg = std::max(worst_avg, load.avg_loss_percent);
    }
    return {
        {"frame_size", static_cast<double>(result.frame_size)},
        {"loads", static_cast<double>(result.loads.size())},
        {"packets_sent", static_cast<double>(sent)},
        {"packets_lost", static_cast<double>(lost)},
        {"max_avg_loss_percent", worst_avg},
    };
}

} // namespace Tsnbench
