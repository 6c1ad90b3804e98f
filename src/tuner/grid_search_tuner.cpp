/**
 * @file grid_search_tuner.cpp
 * @brief GridSearchTuner — odometer-style enumeration, last axis fastest.
 */

#include "tuner/grid_search_tuner.hpp"

namespace autotune {

GridSearchTuner::GridSearchTuner(SearchSpace space, size_t steps_per_parameter)
    : space_(std::move(space)) {
    axes_.reserve(space_.size());
    for (const auto& spec : space_.parameters()) {
        axes_.push_back(space_.grid_values(spec, steps_per_parameter));
        if (axes_.back().empty()) exhausted_ = true;
    }
    cursor_.assign(axes_.size(), 0);
}

std::optional<TrialSettings> GridSearchTuner::propose(std::span<const TrialResult> /*history*/) {
    if (exhausted_) return std::nullopt;

    TrialSettings settings{.trial_id = next_id_++, .parameters = {}};
    const auto& specs = space_.parameters();
    for (size_t i = 0; i < axes_.size(); ++i) {
        settings.parameters[specs[i].name] = axes_[i][cursor_[i]];
    }

    advance();
    return settings;
}

void GridSearchTuner::advance() {
    for (size_t i = axes_.size(); i-- > 0;) {
        if (++cursor_[i] < axes_[i].size()) return;
        cursor_[i] = 0;
    }
    // Wrapped past the first axis (or there are no axes at all).
    exhausted_ = true;
}

size_t GridSearchTuner::total_points() const noexcept {
    size_t total = 1;
    for (const auto& axis : axes_) total *= axis.size();
    return total;
}

}  // namespace autotune
