#ifndef TSNBENCH_CONFIGURATION_H_
#define TSNBENCH_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Tsnbench {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

struct PathProfileConfig {
    ConfigValue<double> mean_ms;
    ConfigValue<double> stddev_ms;
    ConfigValue<double> floor_ms;
};

/**
 * Main configuration structure
 */
struct TsnbenchConfig {
    // RFC 2544 frame sizes (bytes) the drivers iterate over
    std::vector<int> frame_sizes{64, 128, 256, 512, 1024, 1280, 1518};

    // Zero-loss throughput bisection
    struct RateSearch {
        ConfigValue<double> low_mbps{1.0, "TSNBENCH_RATE_LOW_MBPS"};
        ConfigValue<double> high_mbps{1000.0, "TSNBENCH_RATE_HIGH_MBPS"};
        // Relative window, (high - low) / high
        ConfigValue<double> tolerance{0.01, "TSNBENCH_RATE_TOLERANCE"};
        // Percent; 0.001% loss still counts as zero loss
        ConfigValue<double> loss_threshold_pct{0.001, "TSNBENCH_RATE_LOSS_THRESHOLD"};
        ConfigValue<int> max_iterations{20, "TSNBENCH_RATE_MAX_ITERATIONS"};
    } rate_search;

    // Back-to-back burst capacity
    struct Burst {
        std::vector<int> candidate_sizes{100, 500, 1000, 2000, 5000, 10000};
        ConfigValue<double> loss_threshold_pct{1.0, "TSNBENCH_BURST_LOSS_THRESHOLD"};
        ConfigValue<int> trials{3, "TSNBENCH_BURST_TRIALS"};
        ConfigValue<bool> parallel_trials{false, "TSNBENCH_BURST_PARALLEL"};
    } burst;

    // Frame loss rate at fixed offered loads
    struct FrameLoss {
        ConfigValue<double> link_rate_mbps{1000.0, "TSNBENCH_LINK_RATE_MBPS"};
        std::vector<double> offered_loads_pct{10, 20, 50, 80, 100};
        ConfigValue<int> trials{3, "TSNBENCH_FRAME_LOSS_TRIALS"};
    } frame_loss;

    // Dual-path latency simulation
    struct Simulation {
        ConfigValue<size_t> samples{1000, "TSNBENCH_SIM_SAMPLES"};
        ConfigValue<size_t> seed{42, "TSNBENCH_SIM_SEED"};
        PathProfileConfig path1{{0.40, "TSNBENCH_SIM_PATH1_MEAN_MS"},
                                {0.15, "TSNBENCH_SIM_PATH1_STDDEV_MS"},
                                {0.15, "TSNBENCH_SIM_PATH1_FLOOR_MS"}};
        PathProfileConfig path2{{0.45, "TSNBENCH_SIM_PATH2_MEAN_MS"},
                                {0.12, "TSNBENCH_SIM_PATH2_STDDEV_MS"},
                                {0.15, "TSNBENCH_SIM_PATH2_FLOOR_MS"}};
    } simulation;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Restore built-in defaults (environment overrides still apply on get())
    void resetToDefaults();

    // Get the configuration
    const TsnbenchConfig& config() const { return config_; }
    TsnbenchConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TsnbenchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Tsnbench

#endif // TSNBENCH_CONFIGURATION_H_
