/**
 * @file test_experiment.cpp
 * @brief Unit tests for the Experiment facade.
 */

#include "core/cancellation.hpp"
#include "orchestrator/experiment.hpp"
#include "runner/synthetic_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace autotune;
using namespace std::chrono_literals;

namespace {

class ThrowingRunner : public ITrialRunner {
public:
    Result<TrialResult> run(const TrialSettings&, std::stop_token) override {
        throw std::logic_error("trainer crashed");
    }
    std::string_view name() const noexcept override { return "throwing"; }
};

/// Proposes a fixed number of trials with x = 0.5, the objective's optimum.
class CentreTuner : public ITuner {
public:
    explicit CentreTuner(size_t count) : count_(count) {}

    std::optional<TrialSettings> propose(std::span<const TrialResult>) override {
        if (next_ >= count_) return std::nullopt;
        return TrialSettings{.trial_id = next_++, .parameters = {{"x", 0.5}}};
    }
    std::string_view name() const noexcept override { return "centre"; }

private:
    size_t count_;
    TrialId next_{0};
};

Experiment::Options memory_options(MemorySink** sink_out = nullptr) {
    auto sink = std::make_unique<MemorySink>();
    if (sink_out) *sink_out = sink.get();
    return Experiment::Options{.log_sink = std::move(sink), .log_level = LogLevel::Debug};
}

Config quick_config() {
    auto config = default_config();
    config.experiment.training_time_seconds = 10;
    config.experiment.max_trials = 3;
    config.runner.trial_duration_ms = 10;
    return config;
}

}  // namespace

TEST(ExperimentTest, RunWithoutRunnerIsInvalidState) {
    Experiment experiment(memory_options());
    auto result = experiment.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
    EXPECT_FALSE(experiment.is_running());
}

TEST(ExperimentTest, NullSinkAccepted) {
    Experiment experiment(Experiment::Options{.log_sink = nullptr, .log_level = LogLevel::Info});
    EXPECT_NO_THROW(experiment.logger().info("test", "discarded"));
}

TEST(ExperimentTest, ConfigureAndRun) {
    MemorySink* sink = nullptr;
    Experiment experiment(memory_options(&sink));
    auto configured = experiment.configure(quick_config());
    ASSERT_TRUE(configured.has_value()) << configured.error().message;

    auto result = experiment.run();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(experiment.history().size(), 3u);
    EXPECT_EQ(experiment.last_stop_reason(), StopReason::MaxTrials);
    EXPECT_GT(result->metric, 0.0);
    EXPECT_LE(result->metric, 1.0);
    EXPECT_TRUE(sink->contains("ExperimentScheduler"));
}

TEST(ExperimentTest, ConfigureAppliesSettings) {
    Experiment experiment(memory_options());
    auto config = quick_config();
    config.experiment.metric = "minimize";
    config.experiment.parallelism = 2;
    config.experiment.seed = 17;
    config.telemetry.log_level = "warn";
    ASSERT_TRUE(experiment.configure(config).has_value());

    EXPECT_EQ(experiment.settings().training_time, 10s);
    EXPECT_EQ(experiment.settings().direction, MetricDirection::Minimize);
    EXPECT_EQ(experiment.settings().parallelism, 2u);
    EXPECT_EQ(experiment.settings().max_trials, 3u);
    EXPECT_EQ(experiment.settings().seed, 17u);
    EXPECT_EQ(experiment.logger().level(), LogLevel::Warn);
}

TEST(ExperimentTest, ConfigureRejectsInvalidConfig) {
    Experiment experiment(memory_options());
    auto config = quick_config();
    config.experiment.training_time_seconds = 0;
    auto configured = experiment.configure(config);
    ASSERT_FALSE(configured.has_value());
    EXPECT_EQ(configured.error().code, ErrorCode::InvalidArgument);
}

TEST(ExperimentTest, FluentSettersAndCustomTuner) {
    Experiment experiment(memory_options());
    experiment.set_training_time(5s)
              .set_metric_direction(MetricDirection::Maximize)
              .set_parallelism(1)
              .set_tuner(std::make_unique<CentreTuner>(2))
              .set_trial_runner(make_synthetic_runner_factory(Duration{5}));

    auto result = experiment.run();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_DOUBLE_EQ(result->metric, 1.0);
    EXPECT_EQ(result->trial_id(), 0u);
    EXPECT_EQ(experiment.last_stop_reason(), StopReason::TunerExhausted);
}

TEST(ExperimentTest, InvalidSearchSpaceReported) {
    Experiment experiment(memory_options());
    SearchSpace bad;
    bad.add_uniform("x", 1.0, 0.0);
    experiment.set_search_space(bad)
              .set_trial_runner(make_synthetic_runner_factory(Duration{1}));
    auto result = experiment.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(ExperimentTest, FactoryReturningNullIsInvalidState) {
    Experiment experiment(memory_options());
    experiment.set_trial_runner([](const RunnerContext&) -> std::unique_ptr<ITrialRunner> {
        return nullptr;
    });
    auto result = experiment.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}

TEST(ExperimentTest, RunnerExceptionPropagates) {
    Experiment experiment(memory_options());
    experiment.set_trial_runner([](const RunnerContext&) -> std::unique_ptr<ITrialRunner> {
        return std::make_unique<ThrowingRunner>();
    });
    EXPECT_THROW((void)experiment.run(), std::logic_error);
    EXPECT_FALSE(experiment.is_running());
    EXPECT_EQ(experiment.last_stop_reason(), StopReason::Failure);
}

TEST(ExperimentTest, CallerCancellationStopsRun) {
    Experiment experiment(memory_options());
    experiment.set_training_time_seconds(30)
              .set_trial_runner(make_synthetic_runner_factory(Duration{10000}));

    std::stop_source cancel;
    DelayedCancellation timer(cancel, 100ms);
    auto start = SteadyClock::now();
    auto result = experiment.run(cancel.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_LT(SteadyClock::now() - start, 5s);
    EXPECT_EQ(experiment.last_stop_reason(), StopReason::Cancelled);
}

TEST(ExperimentTest, RunAsyncAndRejectConcurrentRun) {
    Experiment experiment(memory_options());
    experiment.set_training_time_seconds(30)
              .set_trial_runner(make_synthetic_runner_factory(Duration{10000}));

    std::stop_source cancel;
    auto future = experiment.run_async(cancel.get_token());

    auto deadline = SteadyClock::now() + 5s;
    while (!experiment.is_running() && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(experiment.is_running());

    auto second = experiment.run();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::InvalidState);

    cancel.request_stop();
    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
}

TEST(ExperimentTest, RepeatedRunsWithSameSeedMatch) {
    Experiment experiment(memory_options());
    ASSERT_TRUE(experiment.configure(quick_config()).has_value());

    auto first = experiment.run();
    auto first_history = experiment.history();
    auto second = experiment.run();
    auto second_history = experiment.history();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first_history.size(), second_history.size());
    for (size_t i = 0; i < first_history.size(); ++i) {
        EXPECT_EQ(*first_history[i].settings, *second_history[i].settings);
    }
}

TEST(ExperimentTest, SettersIgnoredWhileRunning) {
    MemorySink* sink = nullptr;
    Experiment experiment(memory_options(&sink));
    experiment.set_training_time_seconds(30)
              .set_parallelism(1)
              .set_trial_runner(make_synthetic_runner_factory(Duration{10000}));

    std::stop_source cancel;
    auto future = experiment.run_async(cancel.get_token());

    auto deadline = SteadyClock::now() + 5s;
    while (!experiment.is_running() && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(experiment.is_running());

    experiment.set_training_time(Duration{1})
              .set_parallelism(8)
              .set_tuner(TunerConfig{.kind = "grid", .grid_steps = 2})
              .set_tuner(std::make_unique<CentreTuner>(1));
    EXPECT_EQ(experiment.settings().training_time, Duration{std::chrono::seconds{30}});
    EXPECT_EQ(experiment.settings().parallelism, 1u);
    EXPECT_TRUE(sink->contains("while the experiment is running"));

    auto configured = experiment.configure(quick_config());
    ASSERT_FALSE(configured.has_value());
    EXPECT_EQ(configured.error().code, ErrorCode::InvalidState);

    cancel.request_stop();
    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(experiment.last_stop_reason(), StopReason::Cancelled);

    // Changes apply again once the run is over.
    experiment.set_training_time(Duration{2000});
    EXPECT_EQ(experiment.settings().training_time, Duration{2000});
}
