#include "path_latency_simulator.h"

#include <algorithm>
#include <stdexcept>

namespace Tsnbench {

PathLatencySimulator::PathLatencySimulator(uint64_t seed) : seed_(seed), rng_(seed) {}

double PathLatencySimulator::Sample(const PathProfile& profile) {
    if (profile.stddev_ms < 0.0) {
        throw std::invalid_argument("Path latency stddev must not be negative");
    }
    if (profile.stddev_ms == 0.0) {
        return std::max(profile.floor_ms, profile.mean_ms);
    }
    std::normal_distribution<double> dist(profile.mean_ms, profile.stddev_ms);
    return std::max(profile.floor_ms, dist(rng_));
}

bool PathLatencySimulator::Drop(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    std::bernoulli_distribution dist(probability);
    return dist(rng_);
}

std::vector<double> PathLatencySimulator::Simulate(const PathProfile& profile, size_t count) {
    std::vector<double> samples;
    samples.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        samples.push_back(Sample(profile));
    }
    return samples;
}

std::pair<std::vector<double>, std::vector<double>> PathLatencySimulator::SimulateDualPath(
    const PathProfile& path1, const PathProfile& path2, size_t count) {
    std::vector<double> first;
    std::vector<double> second;
    first.reserve(count);
    second.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        first.push_back(Sample(path1));
        second.push_back(Sample(path2));
    }
    return {std::move(first), std::move(second)};
}

} // namespace Tsnbench
