/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>

namespace autotune {

namespace {

/// Narrow a TOML integer to an unsigned field, rejecting negative and too-large values.
template <typename T>
Result<T> checked_unsigned(std::string_view key, int64_t value) {
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{key} + " out of range: " + std::to_string(value)};
    }
    return static_cast<T>(value);
}

Result<ParameterSpec> parse_parameter(const toml::table& entry) {
    ParameterSpec spec;
    spec.name = entry["name"].value_or(std::string{});

    auto kind = parse_parameter_kind(entry["type"].value_or(std::string{"uniform"}));
    if (!kind) return kind.error();
    spec.kind = *kind;

    if (spec.kind == ParameterKind::Choice) {
        if (const auto* values = entry["values"].as_array()) {
            for (const auto& v : *values) {
                if (auto s = v.value<std::string>()) {
                    spec.choices.push_back(*s);
                } else {
                    return Error{ErrorCode::ParseError,
                                 "Choice values must be strings: " + spec.name};
                }
            }
        }
    } else {
        spec.min = entry["min"].value_or(0.0);
        spec.max = entry["max"].value_or(1.0);
    }
    return spec;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [experiment]
        if (auto experiment = tbl["experiment"]; experiment.is_table()) {
            auto budget = checked_unsigned<uint32_t>("training_time_seconds",
                experiment["training_time_seconds"].value_or(int64_t{10}));
            if (!budget) return budget.error();
            config.experiment.training_time_seconds = *budget;

            auto max_trials = checked_unsigned<uint64_t>("max_trials",
                experiment["max_trials"].value_or(int64_t{0}));
            if (!max_trials) return max_trials.error();
            config.experiment.max_trials = *max_trials;

            auto parallelism = checked_unsigned<uint32_t>("parallelism",
                experiment["parallelism"].value_or(int64_t{1}));
            if (!parallelism) return parallelism.error();
            config.experiment.parallelism = *parallelism;

            config.experiment.metric = experiment["metric"].value_or(std::string{"maximize"});

            auto seed = checked_unsigned<uint64_t>("seed",
                experiment["seed"].value_or(int64_t{1}));
            if (!seed) return seed.error();
            config.experiment.seed = *seed;
        }

        // [tuner]
        if (auto tuner = tbl["tuner"]; tuner.is_table()) {
            config.tuner.kind = tuner["kind"].value_or(std::string{"random"});
            auto steps = checked_unsigned<uint32_t>("grid_steps",
                tuner["grid_steps"].value_or(int64_t{5}));
            if (!steps) return steps.error();
            config.tuner.grid_steps = *steps;
        }

        // [runner]
        if (auto runner = tbl["runner"]; runner.is_table()) {
            auto duration = checked_unsigned<uint32_t>("trial_duration_ms",
                runner["trial_duration_ms"].value_or(int64_t{1000}));
            if (!duration) return duration.error();
            config.runner.trial_duration_ms = *duration;
        }

        // [[search_space]]
        if (const auto* params = tbl["search_space"].as_array()) {
            for (const auto& node : *params) {
                const auto* entry = node.as_table();
                if (!entry) {
                    return Error{ErrorCode::ParseError, "search_space entries must be tables"};
                }
                auto spec = parse_parameter(*entry);
                if (!spec) return spec.error();
                config.search_space.push_back(std::move(*spec));
            }
        } else {
            config.search_space = default_config().search_space;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            auto max_size = checked_unsigned<uint32_t>("max_file_size_mb",
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = checked_unsigned<uint32_t>("rotate_count",
                telemetry["rotate_count"].value_or(int64_t{5}));
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.record_trials = telemetry["record_trials"].value_or(true);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.experiment.training_time_seconds == 0) {
        return Error{ErrorCode::InvalidArgument, "training_time_seconds must be positive"};
    }
    if (config.experiment.parallelism == 0) {
        return Error{ErrorCode::InvalidArgument, "parallelism must be at least 1"};
    }
    if (config.experiment.metric != "maximize" && config.experiment.metric != "minimize") {
        return Error{ErrorCode::InvalidArgument, "Unknown metric direction: " + config.experiment.metric};
    }
    if (config.tuner.kind != "random" && config.tuner.kind != "grid") {
        return Error{ErrorCode::InvalidArgument, "Unknown tuner: " + config.tuner.kind};
    }
    if (config.tuner.kind == "grid"
        && (config.tuner.grid_steps == 0 || config.tuner.grid_steps > kMaxGridSteps)) {
        return Error{ErrorCode::InvalidArgument,
                     "grid_steps must be between 1 and " + std::to_string(kMaxGridSteps)};
    }
    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error();
    }
    return SearchSpace{config.search_space}.validate();
}

Result<uint32_t> parse_uint32(std::string_view text) {
    uint32_t value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return Error{ErrorCode::InvalidArgument,
                     "Expected a non-negative integer up to 4294967295: " + std::string{text}};
    }
    return value;
}

Config default_config() {
    Config config;
    config.search_space = SearchSpace{}
        .add_uniform("x", 0.0, 1.0)
        .add_uniform("y", 0.0, 1.0)
        .parameters();
    return config;
}

}  // namespace autotune
