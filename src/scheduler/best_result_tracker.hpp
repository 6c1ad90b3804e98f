/**
 * @file best_result_tracker.hpp
 * @brief Running record of the best completed trial.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>
#include <optional>

namespace autotune {

/**
 * @brief Holds the best TrialResult seen so far for a metric direction.
 *
 * Moves only on a strictly better metric, so it never regresses and ties
 * keep the earlier result. Updates are serialized by an internal mutex.
 */
class BestResultTracker {
public:
    explicit BestResultTracker(MetricDirection direction = MetricDirection::Maximize);

    /// @return true if @p result became the new best.
    bool offer(const TrialResult& result);

    [[nodiscard]] std::optional<TrialResult> best() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] MetricDirection direction() const noexcept { return direction_; }

    void reset();

private:
    MetricDirection direction_;
    mutable std::mutex mutex_;
    std::optional<TrialResult> best_;
};

}  // namespace autotune
