/**
 * @file config.hpp
 * @brief Experiment configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "tuner/search_space.hpp"
#include "tuner/tuner.hpp"

namespace autotune {

struct ExperimentConfig {
    uint32_t training_time_seconds = 10;
    uint64_t max_trials = 0;            ///< 0 = unlimited
    uint32_t parallelism = 1;
    std::string metric = "maximize";    ///< "maximize", "minimize"
    uint64_t seed = 1;
};

struct RunnerConfig {
    uint32_t trial_duration_ms = 1000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool record_trials = true;          ///< Write trial events as NDJSON
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ExperimentConfig experiment;
    TunerConfig tuner;
    RunnerConfig runner;
    std::vector<ParameterSpec> search_space;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges and enumerations.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Parse a command-line override as a non-negative 32-bit integer.
 *
 * Accepts decimal digits only; a sign, surrounding whitespace or a value
 * above UINT32_MAX is an InvalidArgument error.
 */
Result<uint32_t> parse_uint32(std::string_view text);

/**
 * @brief Create a default configuration (two uniform parameters on [0, 1]).
 */
Config default_config();

}  // namespace autotune
