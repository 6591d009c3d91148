#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>

namespace Tsnbench {

/**
 * Outcome of one measurement trial at a candidate rate or burst size.
 * success == false means the trial produced no usable data (tool error,
 * timeout, nothing parsed) and is treated as total loss by the engines.
 */
struct ProbeResult {
    bool success = false;
    double loss_percent = 100.0;
    // Offered rate or burst size the trial ran at; InvokeProbe fills it in
    double target_value = 0.0;
    double actual_value = 0.0;
    uint64_t packets_sent = 0;
    uint64_t packets_lost = 0;
};

// Measures at an offered rate (Mbps or frames/s, whatever the caller's axis is)
using RateProbe = std::function<ProbeResult(double rate)>;
// Measures a back-to-back burst of the given number of frames
using BurstProbe = std::function<ProbeResult(int burst_size)>;

inline ProbeResult ProbeSuccess(double loss_percent, double actual_value = 0.0,
                                uint64_t packets_sent = 0, uint64_t packets_lost = 0) {
    ProbeResult result;
    result.success = true;
    result.loss_percent = loss_percent;
    result.actual_value = actual_value;
    result.packets_sent = packets_sent;
    result.packets_lost = packets_lost;
    return result;
}

inline ProbeResult ProbeFailure() {
    return ProbeResult{};
}

/**
 * Runs a probe and folds every failure mode into a ProbeResult with
 * loss_percent == 100. A probe that throws, whatever it throws, is logged and
 * counted as failed. target_value is always set to arg.
 */
template <typename Probe, typename Arg>
ProbeResult InvokeProbe(const Probe& probe, Arg arg, const char* what) {
    ProbeResult failed = ProbeFailure();
    failed.target_value = static_cast<double>(arg);
    if (!probe) {
        LOG(ERROR) << what << " probe is not set";
        return failed;
    }
    ProbeResult result;
    try {
        result = probe(arg);
    } catch (const std::exception& e) {
        LOG(WARNING) << what << " probe at " << arg << " threw: " << e.what();
        return failed;
    } catch (...) {
        LOG(WARNING) << what << " probe at " << arg << " threw a non-standard exception";
        return failed;
    }
    result.target_value = static_cast<double>(arg);
    if (!result.success) {
        LOG(WARNING) << what << " probe at " << arg << " failed, assuming total loss";
        result.loss_percent = 100.0;
    }
    return result;
}

inline std::vector<std::pair<std::string, double>> ToFields(const ProbeResult& result) {
    return {
        {"success", result.success ? 1.0 : 0.0},
        {"loss_percent", result.loss_percent},
        {"target_rate", result.target_value},
        {"actual_value", result.actual_value},
        {"packets_sent", static_cast<double>(result.packets_sent)},
        {"packets_lost", static_cast<double>(result.packets_lost)},
    };
}

} // namespace Tsnbench
