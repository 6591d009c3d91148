#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../analysis/dual_path_comparator.h"
#include "../analysis/latency_stats.h"
#include "../analysis/sequence_analyzer.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../search/burst_capacity.h"
#include "../search/frame_loss.h"
#include "../search/rate_search.h"
#include "../simulation/link_model.h"
#include "../simulation/path_latency_simulator.h"

using namespace Tsnbench;

namespace {

std::string FormatFields(const std::vector<std::pair<std::string, double>>& fields) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << fields[i].first << "=" << fields[i].second;
    }
    return ss.str();
}

PathProfile ToProfile(const PathProfileConfig& cfg) {
    PathProfile profile;
    profile.mean_ms = cfg.mean_ms.get();
    profile.stddev_ms = cfg.stddev_ms.get();
    profile.floor_ms = cfg.floor_ms.get();
    return profile;
}

void RunFrerComparison(const TsnbenchConfig& cfg, uint64_t seed, size_t samples,
                       double replica_loss) {
    const PathProfile path1 = ToProfile(cfg.simulation.path1);
    const PathProfile path2 = ToProfile(cfg.simulation.path2);
    PathLatencySimulator simulator(seed);

    LOG(INFO) << "Simulating " << samples << " samples on dual paths (seed " << seed << ")";
    auto [lat1, lat2] = simulator.SimulateDualPath(path1, path2, samples);
    const DualPathComparison cmp = Compare(lat1, lat2);

    LOG(INFO) << "Path 1:  " << FormatFields(ToFields(cmp.path1_stats));
    LOG(INFO) << "Path 2:  " << FormatFields(ToFields(cmp.path2_stats));
    LOG(INFO) << "Selected: " << FormatFields(ToFields(cmp.selected_stats));
    LOG(INFO) << std::fixed << std::setprecision(2)
              << "Average latency improvement: " << cmp.improvement_avg_pct << "%";
    LOG(INFO) << std::fixed << std::setprecision(2)
              << "P99 latency improvement:     " << cmp.improvement_p99_pct << "%";
    LOG(INFO) << std::fixed << std::setprecision(2)
              << "Jitter reduction:            " << cmp.improvement_jitter_pct << "%";

    const auto capture = SimulateReplicatedCapture(simulator, path1, path2, samples,
                                                   /*send_interval_ms=*/1.0, replica_loss,
                                                   /*stream_id=*/1);
    const SequenceAnalysis analysis = AnalyzeTaggedPayloads(capture, 1);
    LOG(INFO) << "Elimination: " << FormatFields(ToFields(analysis));
}

void RunRateSearch(const TsnbenchConfig& cfg, LinkModel& link) {
    RateSearchEngine engine(link.RateProbeFn());
    for (int frame_size : cfg.frame_sizes) {
        link.set_frame_size(frame_size);
        LOG(INFO) << "Binary search for zero-loss throughput (" << frame_size << " bytes)";
        RateSearchResult res = engine.FindMaxZeroLossRate(
            cfg.rate_search.low_mbps.get(), cfg.rate_search.high_mbps.get(),
            cfg.rate_search.tolerance.get(), cfg.rate_search.loss_threshold_pct.get(),
            cfg.rate_search.max_iterations.get());
        LOG(INFO) << "  " << frame_size << " bytes: " << std::fixed << std::setprecision(2)
                  << res.best_rate << " Mbps after " << res.iterations << " iterations ("
                  << ToString(res.outcome) << (res.found ? "" : ", no passing rate") << ")";
        for (const ProbeResult& probe : res.probes) {
            VLOG(1) << "    " << FormatFields(ToFields(probe));
        }
    }
}

void RunBurstSearch(const TsnbenchConfig& cfg, LinkModel& link) {
    BurstCapacityEngine engine(link.BurstProbeFn());
    for (int frame_size : cfg.frame_sizes) {
        link.set_frame_size(frame_size);
        BurstSearchParams params;
        params.candidate_sizes = cfg.burst.candidate_sizes;
        params.loss_threshold = cfg.burst.loss_threshold_pct.get();
        params.trials = cfg.burst.trials.get();
        params.frame_size = frame_size;
        // LinkModel keeps a single generator, so its probe is not thread-safe
        params.parallel_trials = false;
        if (cfg.burst.parallel_trials.get()) {
            LOG(WARNING) << "Ignoring parallel burst trials for the modelled link";
        }
        BurstResult res = engine.MaxBurstNoLoss(params);
        LOG(INFO) << "  " << FormatFields(ToFields(res));
    }
}

void RunFrameLoss(const TsnbenchConfig& cfg, LinkModel& link) {
    for (int frame_size : cfg.frame_sizes) {
        link.set_frame_size(frame_size);
        FrameLossResult res = MeasureFrameLoss(frame_size, cfg.frame_loss.offered_loads_pct,
                                               cfg.frame_loss.link_rate_mbps.get(),
                                               link.RateProbeFn(), cfg.frame_loss.trials.get());
        LOG(INFO) << "Frame loss: " << FormatFields(ToFields(res));
        for (const FrameLossLoadResult& load : res.loads) {
            VLOG(1) << "    " << FormatFields(ToFields(load));
        }
    }
}

int Run(const cxxopts::ParseResult& result) {
    FLAGS_v = result["log_level"].as<int>();

    Configuration& config = Configuration::getInstance();
    if (result.count("config")) {
        if (!config.loadFromFile(result["config"].as<std::string>())) {
            LOG(ERROR) << "Failed to load configuration";
            return 1;
        }
    } else if (!config.validate()) {
        return 1;
    }
    const TsnbenchConfig& cfg = config.config();

    const uint64_t seed = result.count("seed") ? result["seed"].as<uint64_t>()
                                               : cfg.simulation.seed.get();
    const size_t samples = result.count("samples") ? result["samples"].as<size_t>()
                                                   : cfg.simulation.samples.get();
    const std::string mode = result["mode"].as<std::string>();

    LinkModelParams link_params;
    link_params.capacity_mbps = result["capacity_mbps"].as<double>();
    link_params.buffer_frames = result["buffer_frames"].as<int>();
    link_params.failure_probability = result["failure_probability"].as<double>();
    link_params.seed = seed;

    try {
        LinkModel link(link_params);
        bool ran = false;
        if (mode == "frer" || mode == "all") {
            RunFrerComparison(cfg, seed, samples, result["replica_loss"].as<double>());
            ran = true;
        }
        if (mode == "rate" || mode == "all") {
            RunRateSearch(cfg, link);
            ran = true;
        }
        if (mode == "burst" || mode == "all") {
            RunBurstSearch(cfg, link);
            ran = true;
        }
        if (mode == "loss" || mode == "all") {
            RunFrameLoss(cfg, link);
            ran = true;
        }
        if (!ran) {
            LOG(ERROR) << "Invalid mode option: " << mode;
            return 1;
        }
        VLOG(1) << "Modelled link answered " << link.probes_run() << " probes";
    } catch (const InsufficientData& e) {
        LOG(ERROR) << "Not enough data: " << e.what();
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Invalid parameters: " << e.what();
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("tsnbench-analyze", "RFC 2544 / FRER measurement analysis");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("m,mode", "What to run: frer, rate, burst, loss or all",
            cxxopts::value<std::string>()->default_value("all"))
        ("seed", "Seed for simulated latencies (overrides config)", cxxopts::value<uint64_t>())
        ("n,samples", "Simulated samples per path (overrides config)", cxxopts::value<size_t>())
        ("replica_loss", "Probability that a single replica is lost",
            cxxopts::value<double>()->default_value("0"))
        ("capacity_mbps", "Capacity of the modelled link",
            cxxopts::value<double>()->default_value("940"))
        ("buffer_frames", "Burst buffer of the modelled link",
            cxxopts::value<int>()->default_value("1500"))
        ("failure_probability", "Share of modelled trials that return no data",
            cxxopts::value<double>()->default_value("0"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        return Run(result);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        return 1;
    }
}
