#include "rate_search.h"

#include <stdexcept>
#include <string>
#include <utility>

#include <glog/logging.h>

namespace Tsnbench {

const char* ToString(SearchOutcome outcome) {
    switch (outcome) {
        case SearchOutcome::kSearching:
            return "searching";
        case SearchOutcome::kConverged:
            return "converged";
        case SearchOutcome::kExhausted:
            return "exhausted";
    }
    return "unknown";
}

RateSearchEngine::RateSearchEngine(RateProbe probe) : probe_(std::move(probe)) {}

bool RateSearchEngine::Step(SearchState& state, double loss_threshold) const {
    if (state.outcome != SearchOutcome::kSearching) {
        return false;
    }
    if (state.high <= 0.0 || (state.high - state.low) / state.high <= state.tolerance) {
        state.outcome = SearchOutcome::kConverged;
        return false;
    }
    if (state.iterations >= state.max_iterations) {
        state.outcome = SearchOutcome::kExhausted;
        return false;
    }

    state.iterations++;
    const double mid = (state.low + state.high) / 2.0;
    VLOG(1) << "Iteration " << state.iterations << ": testing " << mid;

    const ProbeResult result = InvokeProbe(probe_, mid, "Rate");
    state.probes.push_back(result);
    if (!result.success) {
        // Never credit a failed trial, only narrow from above
        state.high = mid;
        return true;
    }

    VLOG(1) << "  loss " << result.loss_percent << "% (actual " << result.actual_value << ", "
            << result.packets_lost << "/" << result.packets_sent << " packets lost)";
    if (result.loss_percent < loss_threshold) {
        state.best_known = mid;
        state.found = true;
        state.low = mid;
    } else {
        state.high = mid;
    }
    return true;
}

RateSearchResult RateSearchEngine::FindMaxZeroLossRate(double low, double high, double tolerance,
                                                       double loss_threshold,
                                                       int max_iterations) const {
    if (low < 0.0 || !(high > low)) {
        throw std::invalid_argument("Invalid search range [" + std::to_string(low) + ", " +
                                    std::to_string(high) + "]");
    }
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument("Search tolerance must be positive");
    }
    if (max_iterations < 0) {
        throw std::invalid_argument("max_iterations must not be negative");
    }

    SearchState state;
    state.low = low;
    state.high = high;
    state.tolerance = tolerance;
    state.max_iterations = max_iterations;

    while (Step(state, loss_threshold)) {
    }

    if (state.outcome == SearchOutcome::kExhausted) {
        LOG(INFO) << "Rate search stopped after " << state.iterations
                  << " iterations with window [" << state.low << ", " << state.high << "]";
    }
    LOG(INFO) << "Maximum zero-loss rate: " << state.best_known << " ("
              << ToString(state.outcome) << ", " << state.iterations << " iterations)";

    RateSearchResult result;
    result.best_rate = state.best_known;
    result.iterations = state.iterations;
    result.outcome = state.outcome;
    result.found = state.found;
    result.probes = std::move(state.probes);
    return result;
}

RateSearchResult RateSearchEngine::FindMaxZeroLossRate(const RateSearchParams& params) const {
    return FindMaxZeroLossRate(params.low, params.high, params.tolerance,
                               params.loss_threshold, params.max_iterations);
}

RateSearchResult FindMaxZeroLossRate(const RateProbe& probe, double low, double high,
                                     double tolerance, double loss_threshold,
                                     int max_iterations) {
    return RateSearchEngine(probe).FindMaxZeroLossRate(low, high, tolerance, loss_threshold,
                                                       max_iterations);
}

std::vector<std::pair<std::string, double>> ToFields(const RateSearchResult& result) {
    return {
        {"best_rate", result.best_rate},
        {"iterations", static_cast<double>(result.iterations)},
        {"outcome", static_cast<double>(static_cast<int>(result.outcome))},
        {"found", result.found ? 1.0 : 0.0},
    };
}

} // namespace Tsnbench
