/**
 * @file experiment.cpp
 * @brief Experiment facade implementation.
 */

#include "orchestrator/experiment.hpp"

#include "runner/synthetic_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <string>

namespace autotune {

namespace {

constexpr std::string_view kSource = "Experiment";

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

Experiment::Experiment(Options opts)
    : logger_(sink_or_null(std::move(opts.log_sink)), opts.log_level)
    , search_space_(default_config().search_space) {}

Experiment::~Experiment() {
    background_.wait_idle();
}

// ── Configuration ────────────────────────────

bool Experiment::accepts_changes(std::string_view what) {
    if (!running_.load()) return true;
    logger_.warn(kSource, "Ignoring " + std::string{what} + " change while the experiment is running");
    return false;
}

Experiment& Experiment::set_training_time_seconds(uint32_t seconds) {
    return set_training_time(std::chrono::seconds{seconds});
}

Experiment& Experiment::set_training_time(Duration budget) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("training time")) settings_.training_time = budget;
    return *this;
}

Experiment& Experiment::set_metric_direction(MetricDirection direction) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("metric direction")) settings_.direction = direction;
    return *this;
}

Experiment& Experiment::set_max_trials(size_t max_trials) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("max trials")) settings_.max_trials = max_trials;
    return *this;
}

Experiment& Experiment::set_parallelism(size_t parallelism) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("parallelism")) settings_.parallelism = parallelism;
    return *this;
}

Experiment& Experiment::set_seed(uint64_t seed) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("seed")) settings_.seed = seed;
    return *this;
}

Experiment& Experiment::set_search_space(SearchSpace space) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("search space")) search_space_ = std::move(space);
    return *this;
}

Experiment& Experiment::set_tuner(TunerConfig config) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("tuner")) {
        tuner_config_ = std::move(config);
        custom_tuner_.reset();
    }
    return *this;
}

Experiment& Experiment::set_tuner(std::unique_ptr<ITuner> tuner) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("tuner")) custom_tuner_ = std::move(tuner);
    return *this;
}

Experiment& Experiment::set_trial_runner(TrialRunnerFactory factory) {
    std::lock_guard lock(config_mutex_);
    if (accepts_changes("trial runner")) runner_factory_ = std::move(factory);
    return *this;
}

Result<void> Experiment::configure(const Config& config) {
    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) return level.error();

    std::lock_guard lock(config_mutex_);
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "Cannot configure while the experiment is running"};
    }
    logger_.set_level(*level);
    settings_.training_time = std::chrono::seconds{config.experiment.training_time_seconds};
    settings_.direction = config.experiment.metric == "minimize" ? MetricDirection::Minimize
                                                                 : MetricDirection::Maximize;
    settings_.max_trials = static_cast<size_t>(config.experiment.max_trials);
    settings_.parallelism = config.experiment.parallelism;
    settings_.seed = config.experiment.seed;
    search_space_ = SearchSpace{config.search_space};
    tuner_config_ = config.tuner;
    custom_tuner_.reset();
    runner_factory_ = make_synthetic_runner_factory(Duration{config.runner.trial_duration_ms});
    return {};
}

// ── Execution ────────────────────────────────

Result<TrialResult> Experiment::run(std::stop_token stop) {
    std::unique_lock config_lock(config_mutex_);
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return Error{ErrorCode::InvalidState, "Experiment is already running"};
    }
    struct RunningGuard {
        std::atomic<bool>& flag;
        ~RunningGuard() { flag.store(false); }
    } guard{running_};

    if (!runner_factory_) {
        return Error{ErrorCode::InvalidState, "No trial runner configured"};
    }

    // A caller-supplied tuner keeps its state across runs; a configured one
    // is rebuilt so every run starts from the same seed.
    std::unique_ptr<ITuner> owned_tuner;
    ITuner* tuner = custom_tuner_.get();
    if (!tuner) {
        auto created = create_tuner(tuner_config_, search_space_, settings_.seed);
        if (!created) {
            logger_.error(kSource, "Cannot create tuner: " + created.error().message);
            return created.error();
        }
        owned_tuner = std::move(*created);
        tuner = owned_tuner.get();
    }

    ExperimentSettings run_settings = settings_;
    run_settings.stop_token = std::move(stop);
    TrialRunnerFactory runner_factory = runner_factory_;
    config_lock.unlock();

    auto runner = runner_factory(RunnerContext{run_settings, events_, logger_});
    if (!runner) {
        return Error{ErrorCode::InvalidState, "Trial runner factory returned no runner"};
    }

    ExperimentScheduler scheduler(run_settings, *tuner, *runner, events_, logger_);
    auto remember = [&] {
        std::lock_guard lock(last_run_mutex_);
        last_history_ = scheduler.history();
        last_stop_reason_ = scheduler.stop_reason();
    };

    std::optional<Result<TrialResult>> result;
    try {
        result.emplace(scheduler.run());
    } catch (...) {
        remember();
        throw;
    }
    remember();
    logger_.flush();
    return std::move(*result);
}

std::future<Result<TrialResult>> Experiment::run_async(std::stop_token stop) {
    return background_.submit([this, stop = std::move(stop)]() mutable {
        return run(std::move(stop));
    });
}

std::vector<TrialResult> Experiment::history() const {
    std::lock_guard lock(last_run_mutex_);
    return last_history_;
}

StopReason Experiment::last_stop_reason() const {
    std::lock_guard lock(last_run_mutex_);
    return last_stop_reason_;
}

}  // namespace autotune
