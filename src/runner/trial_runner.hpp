/**
 * @file trial_runner.hpp
 * @brief Trial runner interface — executes one trial configuration.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <memory>
#include <stop_token>
#include <string_view>

namespace autotune {

class EventChannel;
class Logger;
struct ExperimentSettings;

/**
 * @brief Abstract trial executor.
 *
 * Contract:
 * - Long-running work observes @p stop and returns
 *   Error{ErrorCode::Cancelled} if it fires before the trial completes.
 * - A TrialResult is returned only for a trial that ran to completion.
 * - Any other failure is reported as an Error with a different code and is
 *   surfaced to the experiment's caller unchanged.
 *
 * A runner may be invoked concurrently from several worker threads when the
 * experiment runs trials in parallel.
 */
class ITrialRunner {
public:
    virtual ~ITrialRunner() = default;

    virtual Result<TrialResult> run(const TrialSettings& settings, std::stop_token stop) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief What a runner factory may capture from the experiment.
 */
struct RunnerContext {
    const ExperimentSettings& settings;
    EventChannel& events;
    Logger& logger;
};

using TrialRunnerFactory = std::function<std::unique_ptr<ITrialRunner>(const RunnerContext&)>;

}  // namespace autotune
