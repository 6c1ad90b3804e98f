/**
 * @file experiment_scheduler.hpp
 * @brief Time-budgeted, cancellable trial scheduling loop.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "runner/trial_runner.hpp"
#include "scheduler/best_result_tracker.hpp"
#include "telemetry/event_channel.hpp"
#include "tuner/tuner.hpp"

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string_view>
#include <vector>

namespace autotune {

/**
 * @brief Run-wide settings, read-only while the scheduler runs.
 */
struct ExperimentSettings {
    Duration training_time = std::chrono::seconds{10};
    MetricDirection direction = MetricDirection::Maximize;
    size_t max_trials = 0;                  ///< 0 = unlimited
    size_t parallelism = 1;                 ///< Trials in flight at once
    uint64_t seed = 1;
    std::stop_token stop_token;             ///< Caller's cancellation handle
};

/**
 * @brief Why the scheduler loop ended.
 */
enum class StopReason : uint8_t {
    None,               ///< Not run yet
    Deadline,           ///< Training time exhausted
    Cancelled,          ///< Caller's token fired, or a runner reported cancellation
    TunerExhausted,     ///< Tuner had nothing left to propose
    MaxTrials,          ///< max_trials trials finished
    Failure             ///< A runner or the tuner failed
};

[[nodiscard]] constexpr std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::None:           return "none";
        case StopReason::Deadline:       return "deadline";
        case StopReason::Cancelled:      return "cancelled";
        case StopReason::TunerExhausted: return "tuner_exhausted";
        case StopReason::MaxTrials:      return "max_trials";
        case StopReason::Failure:        return "failure";
    }
    return "unknown";
}

/**
 * @brief Proposes trials, runs them and keeps the best result.
 *
 * The loop keeps up to `parallelism` trials in flight until the training
 * time runs out, the caller's stop token fires, the tuner is exhausted or
 * `max_trials` is reached. The runner sees a token that fires on either the
 * caller's cancellation or the deadline; the deadline never fires the
 * caller's own token.
 *
 * Outcome of run():
 * - at least one completed trial: the best result, regardless of why the
 *   loop ended;
 * - none completed: Error{ErrorCode::Timeout}, whether the loop ended on the
 *   deadline or on cancellation;
 * - a runner error other than Cancelled: that error, unchanged;
 * - an exception thrown by the runner: rethrown once in-flight trials drain.
 *
 * Events on the channel: Running before a trial is dispatched, then one of
 * Completed / Cancelled / Failed, and BestUpdated after Completed when the
 * tracker moved. The stop token is re-checked after each publish, so a
 * subscriber cancelling from inside a handler stops the loop right away.
 */
class ExperimentScheduler {
public:
    ExperimentScheduler(ExperimentSettings settings,
                        ITuner& tuner,
                        ITrialRunner& runner,
                        EventChannel& events,
                        Logger& logger);

    ExperimentScheduler(const ExperimentScheduler&) = delete;
    ExperimentScheduler& operator=(const ExperimentScheduler&) = delete;

    Result<TrialResult> run();

    // ── Post-run inspection ──────────────────
    [[nodiscard]] const std::vector<TrialResult>& history() const noexcept { return history_; }
    [[nodiscard]] std::optional<TrialResult> best() const { return tracker_.best(); }
    [[nodiscard]] size_t trials_dispatched() const noexcept { return trials_dispatched_; }
    [[nodiscard]] StopReason stop_reason() const noexcept { return stop_reason_; }
    [[nodiscard]] Duration elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] const ExperimentSettings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] Result<void> validate() const;
    void publish(TrialEventKind kind, const TrialSettings& settings,
                 std::string message, std::optional<double> metric = std::nullopt,
                 Duration duration = Duration{0});

    ExperimentSettings settings_;
    ITuner& tuner_;
    ITrialRunner& runner_;
    EventChannel& events_;
    Logger& logger_;

    BestResultTracker tracker_;
    std::vector<TrialResult> history_;
    size_t trials_dispatched_{0};
    StopReason stop_reason_{StopReason::None};
    Duration elapsed_{0};
};

}  // namespace autotune
