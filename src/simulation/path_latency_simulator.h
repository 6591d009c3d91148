#pragma once

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace Tsnbench {

struct PathProfile {
    double mean_ms = 0.40;
    double stddev_ms = 0.15;
    // Samples are clamped from below; a path never beats its propagation delay
    double floor_ms = 0.15;
};

/**
 * Draws latency samples for independent paths from clamped normal
 * distributions. The generator is seeded explicitly so runs are reproducible.
 */
class PathLatencySimulator {
public:
    explicit PathLatencySimulator(uint64_t seed);

    // One latency draw, max(floor, N(mean, stddev))
    double Sample(const PathProfile& profile);

    std::vector<double> Simulate(const PathProfile& profile, size_t count);

    // Samples both paths interleaved, one draw per path per index
    std::pair<std::vector<double>, std::vector<double>> SimulateDualPath(
        const PathProfile& path1, const PathProfile& path2, size_t count);

    // True with the given probability; draws from the same seeded generator
    bool Drop(double probability);

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
};

} // namespace Tsnbench
