#include "link_model.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>

#include <glog/logging.h>

#include "../analysis/sequence_analyzer.h"

namespace Tsnbench {

LinkModel::LinkModel(const LinkModelParams& params) : params_(params), rng_(params.seed) {
    if (params_.capacity_mbps <= 0.0) {
        throw std::invalid_argument("Link capacity must be positive");
    }
    if (params_.buffer_frames < 0) {
        throw std::invalid_argument("Link buffer must not be negative");
    }
    set_frame_size(params_.frame_size_bytes);
    if (params_.trial_duration_s <= 0.0) {
        throw std::invalid_argument("Trial duration must be positive");
    }
}

void LinkModel::set_frame_size(int frame_size_bytes) {
    if (frame_size_bytes <= 0) {
        throw std::invalid_argument("Frame size must be positive");
    }
    params_.frame_size_bytes = frame_size_bytes;
}

bool LinkModel::TrialFails() {
    if (params_.failure_probability <= 0.0) {
        return false;
    }
    std::bernoulli_distribution dist(std::min(params_.failure_probability, 1.0));
    return dist(rng_);
}

ProbeResult LinkModel::MeasureRate(double offered_mbps) {
    probes_run_++;
    if (TrialFails()) {
        return ProbeFailure();
    }
    const double bits = offered_mbps * 1e6 * params_.trial_duration_s;
    const uint64_t sent = static_cast<uint64_t>(
        std::llround(bits / (static_cast<double>(params_.frame_size_bytes) * 8.0)));
    if (offered_mbps <= params_.capacity_mbps) {
        return ProbeSuccess(0.0, offered_mbps, sent, 0);
    }
    const double loss = (offered_mbps - params_.capacity_mbps) / offered_mbps * 100.0;
    const uint64_t lost = static_cast<uint64_t>(
        std::llround(static_cast<double>(sent) * loss / 100.0));
    return ProbeSuccess(loss, params_.capacity_mbps, sent, lost);
}

ProbeResult LinkModel::MeasureBurst(int burst_size) {
    probes_run_++;
    if (TrialFails()) {
        return ProbeFailure();
    }
    const uint64_t sent = burst_size > 0 ? static_cast<uint64_t>(burst_size) : 0;
    if (burst_size <= params_.buffer_frames) {
        return ProbeSuccess(0.0, burst_size, sent, 0);
    }
    const int lost = burst_size - params_.buffer_frames;
    return ProbeSuccess(static_cast<double>(lost) / burst_size * 100.0, params_.buffer_frames,
                        sent, static_cast<uint64_t>(lost));
}

RateProbe LinkModel::RateProbeFn() {
    return [this](double rate) { return MeasureRate(rate); };
}

BurstProbe LinkModel::BurstProbeFn() {
    return [this](int size) { return MeasureBurst(size); };
}

std::vector<std::vector<uint8_t>> SimulateReplicatedCapture(PathLatencySimulator& simulator,
                                                            const PathProfile& path1,
                                                            const PathProfile& path2,
                                                            size_t count, double send_interval_ms,
                                                            double loss_probability,
                                                            uint16_t stream_id) {
    // (arrival time, path, sequence); path breaks ties deterministically
    std::vector<std::tuple<double, int, uint32_t>> arrivals;
    arrivals.reserve(count * 2);

    for (size_t i = 0; i < count; ++i) {
        const double sent_at = static_cast<double>(i) * send_interval_ms;
        const uint32_t seq = static_cast<uint32_t>(i);
        const double lat1 = simulator.Sample(path1);
        const double lat2 = simulator.Sample(path2);
        if (!simulator.Drop(loss_probability)) {
            arrivals.emplace_back(sent_at + lat1, 1, seq);
        }
        if (!simulator.Drop(loss_probability)) {
            arrivals.emplace_back(sent_at + lat2, 2, seq);
        }
    }
    std::sort(arrivals.begin(), arrivals.end());

    std::vector<std::vector<uint8_t>> capture;
    capture.reserve(arrivals.size());
    for (const auto& arrival : arrivals) {
        capture.push_back(EncodeRTag(stream_id, std::get<2>(arrival)));
    }
    VLOG(1) << "Simulated capture of " << capture.size() << " frames for " << count
            << " replicated sends";
    return capture;
}

} // namespace Tsnbench
