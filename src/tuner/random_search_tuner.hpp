/**
 * @file random_search_tuner.hpp
 * @brief Random search — samples every parameter independently.
 */

#pragma once

#include "tuner/tuner.hpp"

#include <random>

namespace autotune {

class RandomSearchTuner : public ITuner {
public:
    RandomSearchTuner(SearchSpace space, uint64_t seed);

    std::optional<TrialSettings> propose(std::span<const TrialResult> history) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "random"; }

private:
    SearchSpace space_;
    std::mt19937_64 rng_;
    TrialId next_id_{0};
};

}  // namespace autotune
