/**
 * @file synthetic_runner.hpp
 * @brief Trial runner that simulates training with an interruptible wait.
 */

#pragma once

#include "runner/trial_runner.hpp"

#include <functional>
#include <string>

namespace autotune {

class EventChannel;

/// Maps trial settings to a metric.
using ObjectiveFunction = std::function<double(const TrialSettings&)>;

/**
 * @brief Default objective: 1 / (1 + Σ (x - 0.5)²) over numeric parameters.
 *
 * Always in (0, 1]; choice parameters contribute nothing.
 */
double quadratic_bowl(const TrialSettings& settings);

/**
 * @brief Executes synthetic trials of a fixed duration.
 *
 * Publishes "running" and "completed" progress through the event channel
 * when one is attached, the way a real training pipeline reports progress.
 */
class SyntheticTrialRunner : public ITrialRunner {
public:
    explicit SyntheticTrialRunner(Duration trial_duration,
                                  ObjectiveFunction objective = quadratic_bowl,
                                  EventChannel* events = nullptr);

    Result<TrialResult> run(const TrialSettings& settings, std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "synthetic"; }

    [[nodiscard]] Duration trial_duration() const noexcept { return trial_duration_; }

private:
    void report(const TrialSettings& settings, const std::string& message);

    Duration trial_duration_;
    ObjectiveFunction objective_;
    EventChannel* events_;
};

/**
 * @brief Factory producing SyntheticTrialRunners wired to the experiment's
 *        event channel.
 */
TrialRunnerFactory make_synthetic_runner_factory(Duration trial_duration,
                                                 ObjectiveFunction objective = quadratic_bowl);

}  // namespace autotune
