/**
 * @file synthetic_runner.cpp
 * @brief SyntheticTrialRunner implementation.
 */

#include "runner/synthetic_runner.hpp"

#include "core/cancellation.hpp"
#include "telemetry/event_channel.hpp"

#include <chrono>
#include <variant>

namespace autotune {

double quadratic_bowl(const TrialSettings& settings) {
    double distance = 0.0;
    for (const auto& [name, value] : settings.parameters) {
        double x = 0.0;
        if (const auto* d = std::get_if<double>(&value)) {
            x = *d;
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            x = static_cast<double>(*i);
        } else {
            continue;
        }
        distance += (x - 0.5) * (x - 0.5);
    }
    return 1.0 / (1.0 + distance);
}

SyntheticTrialRunner::SyntheticTrialRunner(Duration trial_duration,
                                           ObjectiveFunction objective,
                                           EventChannel* events)
    : trial_duration_(trial_duration)
    , objective_(std::move(objective))
    , events_(events) {}

Result<TrialResult> SyntheticTrialRunner::run(const TrialSettings& settings,
                                              std::stop_token stop) {
    auto start = SteadyClock::now();
    report(settings, "training started");

    if (!interruptible_sleep(trial_duration_, stop)) {
        return Error{ErrorCode::Cancelled,
                     "Trial " + std::to_string(settings.trial_id) + " cancelled"};
    }

    auto metric = objective_(settings);
    report(settings, "training finished");

    return TrialResult{
        .settings = std::make_shared<const TrialSettings>(settings),
        .duration = std::chrono::duration_cast<Duration>(SteadyClock::now() - start),
        .metric = metric
    };
}

void SyntheticTrialRunner::report(const TrialSettings& settings, const std::string& message) {
    if (!events_) return;
    events_->publish(TrialEvent{
        .kind = TrialEventKind::Progress,
        .trial_id = settings.trial_id,
        .message = message,
        .metric = std::nullopt,
        .duration = Duration{0}
    });
}

TrialRunnerFactory make_synthetic_runner_factory(Duration trial_duration,
                                                 ObjectiveFunction objective) {
    return [trial_duration, objective = std::move(objective)](const RunnerContext& ctx) {
        return std::make_unique<SyntheticTrialRunner>(trial_duration, objective, &ctx.events);
    };
}

}  // namespace autotune
