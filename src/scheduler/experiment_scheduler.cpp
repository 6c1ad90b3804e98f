/**
 * @file experiment_scheduler.cpp
 * @brief ExperimentScheduler — the trial control loop.
 *
 * Loop structure:
 *   while slots free and not stopping:
 *     propose → publish Running → re-check stop → dispatch to worker pool
 *   wait for one completion:
 *     Completed → publish → offer to tracker → maybe publish BestUpdated
 *     Cancelled → publish, stop the run
 *     Failed / exception → publish, stop the run, remember the failure
 *   repeat until nothing is in flight
 *
 * An exception from the tuner or an event subscriber stops and drains the
 * in-flight trials before it leaves run().
 *
 * Workers only hand completions back through a queue; history and the
 * tracker are written by the loop thread alone.
 */

#include "scheduler/experiment_scheduler.hpp"

#include "core/cancellation.hpp"
#include "executor/worker_pool.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>

namespace autotune {

namespace {

constexpr std::string_view kSource = "ExperimentScheduler";

struct TrialCompletion {
    std::shared_ptr<const TrialSettings> settings;
    std::optional<Result<TrialResult>> outcome;
    std::exception_ptr exception;
};

class CompletionQueue {
public:
    void push(TrialCompletion completion) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(completion));
        }
        cv_.notify_one();
    }

    TrialCompletion pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty(); });
        auto completion = std::move(queue_.front());
        queue_.pop_front();
        return completion;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TrialCompletion> queue_;
};

std::string describe(const TrialSettings& settings) {
    return "Trial " + std::to_string(settings.trial_id) + " " + to_json(settings.parameters);
}

}  // anonymous namespace

ExperimentScheduler::ExperimentScheduler(ExperimentSettings settings,
                                         ITuner& tuner,
                                         ITrialRunner& runner,
                                         EventChannel& events,
                                         Logger& logger)
    : settings_(std::move(settings))
    , tuner_(tuner)
    , runner_(runner)
    , events_(events)
    , logger_(logger)
    , tracker_(settings_.direction) {}

Result<void> ExperimentScheduler::validate() const {
    if (settings_.training_time <= Duration::zero()) {
        return Error{ErrorCode::InvalidArgument, "Training time must be positive"};
    }
    if (settings_.parallelism == 0) {
        return Error{ErrorCode::InvalidArgument, "Parallelism must be at least 1"};
    }
    return {};
}

void ExperimentScheduler::publish(TrialEventKind kind, const TrialSettings& settings,
                                  std::string message, std::optional<double> metric,
                                  Duration duration) {
    events_.publish(TrialEvent{
        .kind = kind,
        .trial_id = settings.trial_id,
        .message = std::move(message),
        .metric = metric,
        .duration = duration
    });
}

Result<TrialResult> ExperimentScheduler::run() {
    if (auto valid = validate(); !valid) {
        return valid.error();
    }

    history_.clear();
    tracker_.reset();
    trials_dispatched_ = 0;
    stop_reason_ = StopReason::None;

    const auto start = SteadyClock::now();
    const auto deadline = start + settings_.training_time;

    LinkedStopSource run_stop(settings_.stop_token);
    DelayedCancellation deadline_timer(run_stop.source(), settings_.training_time);

    {
        std::ostringstream oss;
        oss << "Experiment started: budget " << settings_.training_time.count() << "ms"
            << ", tuner " << tuner_.name()
            << ", runner " << runner_.name()
            << ", metric " << to_string(settings_.direction)
            << ", parallelism " << settings_.parallelism;
        logger_.info(kSource, oss.str());
    }

    CompletionQueue completions;
    WorkerPool pool(settings_.parallelism);

    size_t in_flight = 0;
    bool halted = false;                        // no further dispatches
    std::optional<TrialId> last_id;
    std::optional<Error> failure;
    std::exception_ptr exception;

    auto should_stop = [&] {
        return run_stop.stop_requested() || SteadyClock::now() >= deadline;
    };

    auto halt = [&](StopReason reason) {
        halted = true;
        if (stop_reason_ == StopReason::None) stop_reason_ = reason;
    };

    // A throwing tuner or subscriber must not leave trials running on the
    // pool: stop them, collect what they return, then rethrow.
    try {
        while (true) {
            // ── Fill free slots ──────────────────
            while (!halted && in_flight < settings_.parallelism && !should_stop()) {
                if (settings_.max_trials != 0 && trials_dispatched_ >= settings_.max_trials) {
                    halt(StopReason::MaxTrials);
                    break;
                }

                auto proposal = tuner_.propose(history_);
                if (!proposal) {
                    logger_.info(kSource, "Tuner exhausted its search space");
                    halt(StopReason::TunerExhausted);
                    break;
                }
                if (last_id && proposal->trial_id <= *last_id) {
                    failure = Error{ErrorCode::InvalidState,
                                    "Tuner proposed non-increasing trial id "
                                    + std::to_string(proposal->trial_id)};
                    halt(StopReason::Failure);
                    run_stop.request_stop();
                    break;
                }
                last_id = proposal->trial_id;

                auto trial = std::make_shared<const TrialSettings>(std::move(*proposal));
                logger_.debug(kSource, "Update Running Trial: " + describe(*trial));
                publish(TrialEventKind::Running, *trial, "Update Running Trial");

                // A subscriber may have cancelled in reaction to the event.
                if (run_stop.stop_requested()) break;

                pool.post([this, trial, token = run_stop.token(), &completions] {
                    TrialCompletion completion{.settings = trial, .outcome = std::nullopt,
                                               .exception = nullptr};
                    try {
                        completion.outcome.emplace(runner_.run(*trial, token));
                    } catch (...) {
                        completion.exception = std::current_exception();
                    }
                    completions.push(std::move(completion));
                });
                ++in_flight;
                ++trials_dispatched_;
            }

            if (in_flight == 0) break;

            // ── Collect one completion ───────────
            auto completion = completions.pop();
            --in_flight;
            const auto& trial = *completion.settings;

            if (completion.exception) {
                logger_.error(kSource, describe(trial) + " threw an exception");
                publish(TrialEventKind::Failed, trial, "Trial runner threw an exception");
                if (!exception && !failure) exception = completion.exception;
                halt(StopReason::Failure);
                run_stop.request_stop();
                continue;
            }

            auto& outcome = *completion.outcome;
            if (outcome.has_value()) {
                TrialResult result = std::move(outcome).value();
                if (!result.settings) result.settings = completion.settings;

                logger_.debug(kSource, "Update Completed Trial: " + describe(trial)
                              + " metric " + std::to_string(result.metric));
                publish(TrialEventKind::Completed, trial, "Update Completed Trial",
                        result.metric, result.duration);

                history_.push_back(result);
                if (tracker_.offer(result)) {
                    logger_.info(kSource, "Update Best Trial: " + describe(trial)
                                 + " metric " + std::to_string(result.metric));
                    publish(TrialEventKind::BestUpdated, trial, "Update Best Trial",
                            result.metric, result.duration);
                }
                continue;
            }

            const auto& error = outcome.error();
            if (error.is(ErrorCode::Cancelled)) {
                logger_.debug(kSource, describe(trial) + " cancelled: " + error.message);
                publish(TrialEventKind::Cancelled, trial, error.message);
                // Cancellation ends the run even when the runner raised it on its own.
                halt((settings_.stop_token.stop_requested() || SteadyClock::now() < deadline)
                         ? StopReason::Cancelled : StopReason::Deadline);
                run_stop.request_stop();
                continue;
            }

            logger_.error(kSource, describe(trial) + " failed: " + error.message);
            publish(TrialEventKind::Failed, trial, error.message);
            if (!exception && !failure) failure = error;
            halt(StopReason::Failure);
            run_stop.request_stop();
        }
    } catch (...) {
        logger_.error(kSource, "Experiment loop aborted by an exception, stopping "
                      + std::to_string(in_flight) + " in-flight trial(s)");
        halt(StopReason::Failure);
        run_stop.request_stop();
        for (; in_flight > 0; --in_flight) {
            auto completion = completions.pop();
            if (!completion.outcome || !completion.outcome->has_value()) continue;
            TrialResult result = std::move(*completion.outcome).value();
            if (!result.settings) result.settings = completion.settings;
            history_.push_back(result);
            tracker_.offer(result);
        }
        deadline_timer.cancel();
        elapsed_ = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
        throw;
    }

    deadline_timer.cancel();
    elapsed_ = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);

    if (stop_reason_ == StopReason::None) {
        if (settings_.stop_token.stop_requested()) {
            stop_reason_ = StopReason::Cancelled;
        } else if (deadline_timer.fired() || SteadyClock::now() >= deadline) {
            stop_reason_ = StopReason::Deadline;
        } else {
            stop_reason_ = StopReason::Cancelled;
        }
    }

    if (exception) {
        logger_.error(kSource, "Experiment aborted by trial runner exception");
        std::rethrow_exception(exception);
    }
    if (failure) {
        logger_.error(kSource, "Experiment aborted: " + failure->message);
        return *failure;
    }

    auto best = tracker_.best();
    std::ostringstream summary;
    summary << "Experiment finished (" << to_string(stop_reason_) << ") after "
            << elapsed_.count() << "ms, " << history_.size() << " completed of "
            << trials_dispatched_ << " dispatched";

    if (!best) {
        logger_.warn(kSource, summary.str() + ", no trial completed");
        return Error{ErrorCode::Timeout, "Training time finished without completing a trial"};
    }

    summary << ", best trial " << best->trial_id() << " metric " << best->metric;
    logger_.info(kSource, summary.str());
    return *best;
}

}  // namespace autotune
