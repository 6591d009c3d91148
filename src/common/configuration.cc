#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Tsnbench {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

void applyPathProfile(const YAML::Node& node, PathProfileConfig& profile) {
    if (node["mean_ms"]) profile.mean_ms.set(node["mean_ms"].as<double>());
    if (node["stddev_ms"]) profile.stddev_ms.set(node["stddev_ms"].as<double>());
    if (node["floor_ms"]) profile.floor_ms.set(node["floor_ms"].as<double>());
}

template<typename T>
std::vector<T> asVector(const YAML::Node& node) {
    std::vector<T> out;
    for (const auto& item : node) {
        out.push_back(item.as<T>());
    }
    return out;
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["tsnbench"]) {
        LOG(WARNING) << "Configuration has no 'tsnbench' section, keeping defaults";
        return;
    }
    auto root = yaml["tsnbench"];

    if (root["frame_sizes"]) {
        config_.frame_sizes = asVector<int>(root["frame_sizes"]);
    }

    // Rate search
    if (root["rate_search"]) {
        auto rs = root["rate_search"];
        if (rs["low_mbps"]) config_.rate_search.low_mbps.set(rs["low_mbps"].as<double>());
        if (rs["high_mbps"]) config_.rate_search.high_mbps.set(rs["high_mbps"].as<double>());
        if (rs["tolerance"]) config_.rate_search.tolerance.set(rs["tolerance"].as<double>());
        if (rs["loss_threshold_pct"]) config_.rate_search.loss_threshold_pct.set(rs["loss_threshold_pct"].as<double>());
        if (rs["max_iterations"]) config_.rate_search.max_iterations.set(rs["max_iterations"].as<int>());
    }

    // Burst
    if (root["burst"]) {
        auto burst = root["burst"];
        if (burst["candidate_sizes"]) config_.burst.candidate_sizes = asVector<int>(burst["candidate_sizes"]);
        if (burst["loss_threshold_pct"]) config_.burst.loss_threshold_pct.set(burst["loss_threshold_pct"].as<double>());
        if (burst["trials"]) config_.burst.trials.set(burst["trials"].as<int>());
        if (burst["parallel_trials"]) config_.burst.parallel_trials.set(burst["parallel_trials"].as<bool>());
    }

    // Frame loss
    if (root["frame_loss"]) {
        auto fl = root["frame_loss"];
        if (fl["link_rate_mbps"]) config_.frame_loss.link_rate_mbps.set(fl["link_rate_mbps"].as<double>());
        if (fl["offered_loads_pct"]) config_.frame_loss.offered_loads_pct = asVector<double>(fl["offered_loads_pct"]);
        if (fl["trials"]) config_.frame_loss.trials.set(fl["trials"].as<int>());
    }

    // Simulation
    if (root["simulation"]) {
        auto sim = root["simulation"];
        if (sim["samples"]) config_.simulation.samples.set(sim["samples"].as<size_t>());
        if (sim["seed"]) config_.simulation.seed.set(sim["seed"].as<size_t>());
        if (sim["path1"]) applyPathProfile(sim["path1"], config_.simulation.path1);
        if (sim["path2"]) applyPathProfile(sim["path2"], config_.simulation.path2);
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    return validate();
}

void Configuration::resetToDefaults() {
    config_ = TsnbenchConfig{};
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    for (int size : config_.frame_sizes) {
        if (size <= 0) {
            validation_errors_.push_back("Frame sizes must be positive");
            break;
        }
    }

    // Rate search
    const auto& rs = config_.rate_search;
    if (rs.low_mbps.get() < 0.0) {
        validation_errors_.push_back("Rate search low bound must not be negative");
    }
    if (rs.high_mbps.get() <= rs.low_mbps.get()) {
        validation_errors_.push_back("Rate search high bound must exceed the low bound");
    }
    if (rs.tolerance.get() <= 0.0 || rs.tolerance.get() >= 1.0) {
        validation_errors_.push_back("Rate search tolerance must be between 0 and 1");
    }
    if (rs.loss_threshold_pct.get() < 0.0 || rs.loss_threshold_pct.get() > 100.0) {
        validation_errors_.push_back("Rate search loss threshold must be between 0 and 100");
    }
    if (rs.max_iterations.get() < 1) {
        validation_errors_.push_back("Rate search max iterations must be at least 1");
    }

    // Burst
    const auto& burst = config_.burst;
    if (burst.candidate_sizes.empty()) {
        validation_errors_.push_back("Burst candidate sizes must not be empty");
    } else if (!std::is_sorted(burst.candidate_sizes.begin(), burst.candidate_sizes.end()) ||
               std::adjacent_find(burst.candidate_sizes.begin(), burst.candidate_sizes.end()) !=
                   burst.candidate_sizes.end() ||
               burst.candidate_sizes.front() <= 0) {
        validation_errors_.push_back("Burst candidate sizes must be positive and strictly ascending");
    }
    if (burst.trials.get() < 1) {
        validation_errors_.push_back("Burst trials must be at least 1");
    }

    // Frame loss
    const auto& fl = config_.frame_loss;
    if (fl.link_rate_mbps.get() <= 0.0) {
        validation_errors_.push_back("Link rate must be positive");
    }
    for (double load : fl.offered_loads_pct) {
        if (load <= 0.0 || load > 100.0) {
            validation_errors_.push_back("Offered loads must be within (0, 100]");
            break;
        }
    }
    if (fl.trials.get() < 1) {
        validation_errors_.push_back("Frame loss trials must be at least 1");
    }

    // Simulation
    const auto& sim = config_.simulation;
    if (sim.samples.get() == 0) {
        validation_errors_.push_back("Simulation needs at least one sample");
    }
    if (sim.path1.stddev_ms.get() < 0.0 || sim.path2.stddev_ms.get() < 0.0) {
        validation_errors_.push_back("Path stddev must not be negative");
    }

    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Tsnbench
