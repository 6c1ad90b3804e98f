/**
 * @file best_result_tracker.cpp
 * @brief BestResultTracker implementation.
 */

#include "scheduler/best_result_tracker.hpp"

#include <cmath>

namespace autotune {

BestResultTracker::BestResultTracker(MetricDirection direction)
    : direction_(direction) {}

bool BestResultTracker::offer(const TrialResult& result) {
    // A NaN metric never replaces a recorded one; any real metric replaces NaN.
    std::lock_guard lock(mutex_);
    if (best_ && (std::isnan(result.metric)
                  || !(std::isnan(best_->metric)
                       || is_better(result.metric, best_->metric, direction_)))) {
        return false;
    }
    best_ = result;
    return true;
}

std::optional<TrialResult> BestResultTracker::best() const {
    std::lock_guard lock(mutex_);
    return best_;
}

bool BestResultTracker::empty() const {
    std::lock_guard lock(mutex_);
    return !best_.has_value();
}

void BestResultTracker::reset() {
    std::lock_guard lock(mutex_);
    best_.reset();
}

}  // namespace autotune
