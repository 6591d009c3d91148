#pragma once

#include <string>
#include <utility>
#include <vector>

#include "probe.h"

namespace Tsnbench {

enum class SearchOutcome {
    kSearching = 0,
    kConverged = 1,  // window narrowed below tolerance
    kExhausted = 2,  // iteration budget ran out first
};

const char* ToString(SearchOutcome outcome);

/**
 * Mutable state of one bisection run. best_known only ever grows. It is 0
 * with found == false until a probed rate passes, so low <= best_known <= high
 * holds only while found is true.
 */
struct SearchState {
    double low = 0.0;
    double high = 0.0;
    double tolerance = 0.0;
    int iterations = 0;
    int max_iterations = 0;
    double best_known = 0.0;
    bool found = false;
    SearchOutcome outcome = SearchOutcome::kSearching;
    // Every probe taken, in order
    std::vector<ProbeResult> probes;
};

struct RateSearchResult {
    double best_rate = 0.0;
    int iterations = 0;
    SearchOutcome outcome = SearchOutcome::kSearching;
    // False when no probed rate passed; best_rate is then 0
    bool found = false;
    std::vector<ProbeResult> probes;
};

struct RateSearchParams {
    double low = 1.0;
    double high = 1000.0;
    double tolerance = 0.01;
    double loss_threshold = 0.001;
    int max_iterations = 20;
};

class RateSearchEngine {
public:
    explicit RateSearchEngine(RateProbe probe);

    /**
     * Bisects [low, high] for the highest rate whose measured loss stays below
     * loss_threshold (percent). A failed or throwing probe counts as 100% loss,
     * so it can only lower the upper bound.
     * @throws std::invalid_argument on an empty range, non-positive tolerance
     *         or negative iteration budget
     */
    RateSearchResult FindMaxZeroLossRate(double low, double high, double tolerance,
                                         double loss_threshold, int max_iterations) const;

    RateSearchResult FindMaxZeroLossRate(const RateSearchParams& params) const;

    // Advances the state by one probe; returns false once the search has ended
    bool Step(SearchState& state, double loss_threshold) const;

private:
    RateProbe probe_;
};

RateSearchResult FindMaxZeroLossRate(const RateProbe& probe, double low, double high,
                                     double tolerance, double loss_threshold,
                                     int max_iterations);

// outcome is reported as the numeric SearchOutcome value
std::vector<std::pair<std::string, double>> ToFields(const RateSearchResult& result);

} // namespace Tsnbench
