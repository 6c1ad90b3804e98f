/**
 * @file types.hpp
 * @brief Fundamental types used throughout AutoTune.
 *
 * Defines TrialId, TrialSettings, TrialResult, MetricDirection and other
 * shared vocabulary types. Settings and results are immutable once built and
 * travel between the tuner, the runner and the scheduler by value or through
 * shared_ptr<const ...>.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace autotune {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TrialId = uint64_t;
using Duration = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// ─────────────────────────────────────────────
// Metric Direction
// ─────────────────────────────────────────────

enum class MetricDirection : uint8_t {
    Maximize,
    Minimize
};

[[nodiscard]] constexpr std::string_view to_string(MetricDirection direction) noexcept {
    switch (direction) {
        case MetricDirection::Maximize: return "maximize";
        case MetricDirection::Minimize: return "minimize";
    }
    return "unknown";
}

/**
 * @brief True when @p candidate is strictly better than @p incumbent.
 *
 * Equal metrics are never "better"; the earlier result keeps its place.
 */
[[nodiscard]] constexpr bool is_better(double candidate, double incumbent,
                                       MetricDirection direction) noexcept {
    return direction == MetricDirection::Maximize ? candidate > incumbent
                                                  : candidate < incumbent;
}

// ─────────────────────────────────────────────
// Trial Settings
// ─────────────────────────────────────────────

using ParameterValue = std::variant<int64_t, double, std::string>;
using Parameters = std::map<std::string, ParameterValue>;

/// Render a parameter value for logs and telemetry.
[[nodiscard]] std::string to_string(const ParameterValue& value);

/// Render a parameter set as a compact JSON object.
[[nodiscard]] std::string to_json(const Parameters& parameters);

/**
 * @brief A configuration proposed by a tuner for evaluation.
 */
struct TrialSettings {
    TrialId trial_id{0};
    Parameters parameters;

    bool operator==(const TrialSettings&) const = default;
};

// ─────────────────────────────────────────────
// Trial Result
// ─────────────────────────────────────────────

/**
 * @brief Outcome of a trial that ran to completion.
 *
 * Only a successful TrialRunner invocation produces one.
 */
struct TrialResult {
    std::shared_ptr<const TrialSettings> settings;
    Duration duration{0};
    double metric{0.0};

    [[nodiscard]] TrialId trial_id() const noexcept {
        return settings ? settings->trial_id : 0;
    }
};

}  // namespace autotune
