/**
 * @file grid_search_tuner.hpp
 * @brief Grid search — walks the Cartesian product of the search space.
 */

#pragma once

#include "tuner/tuner.hpp"

#include <vector>

namespace autotune {

class GridSearchTuner : public ITuner {
public:
    GridSearchTuner(SearchSpace space, size_t steps_per_parameter);

    std::optional<TrialSettings> propose(std::span<const TrialResult> history) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "grid"; }

    /// Number of grid points; 1 for an empty search space.
    [[nodiscard]] size_t total_points() const noexcept;
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

private:
    void advance();

    SearchSpace space_;
    std::vector<std::vector<ParameterValue>> axes_;
    std::vector<size_t> cursor_;
    bool exhausted_ = false;
    TrialId next_id_{0};
};

}  // namespace autotune
