#include "burst_capacity.h"

#include <algorithm>
#include <future>
#include <numeric>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "../analysis/latency_stats.h"

namespace Tsnbench {

namespace {

void ValidateCandidates(const std::vector<int>& candidate_sizes) {
    if (candidate_sizes.empty()) {
        throw std::invalid_argument("Burst search needs at least one candidate size");
    }
    for (size_t i = 0; i < candidate_sizes.size(); ++i) {
        if (candidate_sizes[i] <= 0) {
            throw std::invalid_argument("Burst candidate sizes must be positive");
        }
        if (i > 0 && candidate_sizes[i] <= candidate_sizes[i - 1]) {
            throw std::invalid_argument("Burst candidate sizes must be strictly ascending, without repeats");
        }
    }
}

} // namespace

BurstCapacityEngine::BurstCapacityEngine(BurstProbe probe) : probe_(std::move(probe)) {}

BurstTrial BurstCapacityEngine::RunTrial(const std::vector<int>& candidate_sizes,
                                         double loss_threshold) const {
    BurstTrial trial;
    for (int burst_size : candidate_sizes) {
        VLOG(1) << "Testing burst size: " << burst_size << " frames";
        const ProbeResult result = InvokeProbe(probe_, burst_size, "Burst");
        if (!result.success || result.loss_percent >= loss_threshold) {
            VLOG(1) << "  loss detected at " << burst_size << " frames ("
                    << result.packets_lost << "/" << result.packets_sent << ", "
                    << result.loss_percent << "%)";
            trial.first_loss = result;
            return trial;
        }
        trial.max_burst_no_loss = burst_size;
    }
    trial.exhausted = true;
    return trial;
}

BurstResult BurstCapacityEngine::MaxBurstNoLoss(const BurstSearchParams& params) const {
    ValidateCandidates(params.candidate_sizes);
    if (params.trials < 1) {
        throw std::invalid_argument("Burst search needs at least one trial");
    }

    const size_t trials = static_cast<size_t>(params.trials);
    std::vector<BurstTrial> runs(trials);

    if (params.parallel_trials && trials > 1) {
        std::vector<std::future<BurstTrial>> futures;
        futures.reserve(trials);
        for (size_t t = 0; t < trials; ++t) {
            futures.push_back(std::async(std::launch::async, [this, &params]() {
                return RunTrial(params.candidate_sizes, params.loss_threshold);
            }));
        }
        for (size_t t = 0; t < trials; ++t) {
            runs[t] = futures[t].get();
        }
    } else {
        for (size_t t = 0; t < trials; ++t) {
            VLOG(1) << "Trial " << t + 1 << "/" << trials;
            runs[t] = RunTrial(params.candidate_sizes, params.loss_threshold);
        }
    }

    BurstResult result;
    result.frame_size = params.frame_size;
    for (const BurstTrial& run : runs) {
        result.trial_values.push_back(run.max_burst_no_loss);
    }
    auto worst = std::min_element(runs.begin(), runs.end(),
                                  [](const BurstTrial& a, const BurstTrial& b) {
                                      return a.max_burst_no_loss < b.max_burst_no_loss;
                                  });
    result.max_burst_no_loss = worst->max_burst_no_loss;
    if (!worst->exhausted) {
        result.frames_sent = worst->first_loss.packets_sent;
        result.frames_lost = worst->first_loss.packets_lost;
    }

    const std::vector<double> as_double(result.trial_values.begin(), result.trial_values.end());
    result.avg_burst = std::accumulate(as_double.begin(), as_double.end(), 0.0) /
                       static_cast<double>(as_double.size());
    result.stddev_burst = LatencyStats::SampleStdDev(as_double);
    result.candidates_exhausted = std::any_of(
        runs.begin(), runs.end(), [](const BurstTrial& run) { return run.exhausted; });
    result.trials = std::move(runs);

    LOG(INFO) << "Max burst (no loss) for " << params.frame_size << " byte frames: "
              << result.max_burst_no_loss << " frames, avg " << result.avg_burst
              << ", stddev " << result.stddev_burst;
    if (result.candidates_exhausted) {
        LOG(INFO) << "Largest candidate " << params.candidate_sizes.back()
                  << " passed without loss; capacity may be higher";
    }
    return result;
}

BurstResult MaxBurstNoLoss(const std::vector<int>& candidate_sizes, const BurstProbe& probe,
                           double loss_threshold, int trials) {
    BurstSearchParams params;
    params.candidate_sizes = candidate_sizes;
    params.loss_threshold = loss_threshold;
    params.trials = trials;
    return BurstCapacityEngine(probe).MaxBurstNoLoss(params);
}

std::vector<std::pair<std::string, double>> ToFields(const BurstResult& result) {
    return {
        {"frame_size", static_cast<double>(result.frame_size)},
        {"max_burst_no_loss", static_cast<double>(result.max_burst_no_loss)},
        {"avg_burst", result.avg_burst},
        {"std_burst", result.stddev_burst},
        {"frames_sent", static_cast<double>(result.frames_sent)},
        {"frames_lost", static_cast<double>(result.frames_lost)},
    };
}

} // namespace Tsnbench
