/**
 * @file random_search_tuner.cpp
 * @brief RandomSearchTuner implementation.
 */

#include "tuner/random_search_tuner.hpp"

namespace autotune {

RandomSearchTuner::RandomSearchTuner(SearchSpace space, uint64_t seed)
    : space_(std::move(space)), rng_(seed) {}

std::optional<TrialSettings> RandomSearchTuner::propose(std::span<const TrialResult> /*history*/) {
    return TrialSettings{
        .trial_id = next_id_++,
        .parameters = space_.sample(rng_)
    };
}

}  // namespace autotune
