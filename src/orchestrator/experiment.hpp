/**
 * @file experiment.hpp
 * @brief Top-level Experiment facade — configures and runs a trial search.
 *
 * Provides a single entry point for:
 *   1. Configuring budget, metric direction, search space, tuner and runner
 *   2. Running the scheduler synchronously or on a background worker
 *   3. Inspecting the trial history of the last run
 *
 * Setters return *this so a configuration reads as one chained expression.
 * While a run is in progress the setters log a warning and change nothing,
 * and configure() fails with InvalidState; the run works on a snapshot taken
 * when it started.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "runner/trial_runner.hpp"
#include "scheduler/experiment_scheduler.hpp"
#include "telemetry/event_channel.hpp"
#include "tuner/search_space.hpp"
#include "tuner/tuner.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace autotune {

class Experiment {
public:
    struct Options {
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit Experiment(Options opts);
    ~Experiment();

    // Non-copyable, non-movable
    Experiment(const Experiment&) = delete;
    Experiment& operator=(const Experiment&) = delete;

    // ── Configuration ────────────────────────
    Experiment& set_training_time_seconds(uint32_t seconds);
    Experiment& set_training_time(Duration budget);
    Experiment& set_metric_direction(MetricDirection direction);
    Experiment& set_max_trials(size_t max_trials);
    Experiment& set_parallelism(size_t parallelism);
    Experiment& set_seed(uint64_t seed);
    Experiment& set_search_space(SearchSpace space);
    Experiment& set_tuner(TunerConfig config);
    Experiment& set_tuner(std::unique_ptr<ITuner> tuner);
    Experiment& set_trial_runner(TrialRunnerFactory factory);

    /**
     * @brief Apply a loaded configuration file.
     *
     * Installs a synthetic trial runner with the configured trial duration.
     */
    Result<void> configure(const Config& config);

    // ── Execution ────────────────────────────

    /**
     * @brief Run the experiment on the calling thread.
     *
     * @param stop Caller's cancellation handle; the budget deadline never
     *             requests stop on it.
     */
    Result<TrialResult> run(std::stop_token stop = {});

    /// Run on the experiment's background worker.
    std::future<Result<TrialResult>> run_async(std::stop_token stop = {});

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Accessors ────────────────────────────
    EventChannel& events() noexcept { return events_; }
    Logger& logger() noexcept { return logger_; }
    /// Stable while a run is in progress, since setters are ignored then.
    [[nodiscard]] const ExperimentSettings& settings() const noexcept { return settings_; }

    /// Completed trials of the last finished run, in completion order.
    [[nodiscard]] std::vector<TrialResult> history() const;
    [[nodiscard]] StopReason last_stop_reason() const;

private:
    /// Caller holds config_mutex_. False (with a warning) while running.
    bool accepts_changes(std::string_view what);

    Logger logger_;
    EventChannel events_;
    ExperimentSettings settings_;
    SearchSpace search_space_;
    TunerConfig tuner_config_;
    std::unique_ptr<ITuner> custom_tuner_;
    TrialRunnerFactory runner_factory_;
    std::mutex config_mutex_;

    std::atomic<bool> running_{false};
    mutable std::mutex last_run_mutex_;
    std::vector<TrialResult> last_history_;
    StopReason last_stop_reason_{StopReason::None};

    WorkerPool background_{1};
};

}  // namespace autotune
