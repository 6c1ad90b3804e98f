/**
 * @file tuner_factory.cpp
 * @brief Name-based tuner construction.
 */

#include "tuner/grid_search_tuner.hpp"
#include "tuner/random_search_tuner.hpp"
#include "tuner/tuner.hpp"

namespace autotune {

Result<std::unique_ptr<ITuner>> create_tuner(const TunerConfig& config,
                                             const SearchSpace& space,
                                             uint64_t seed) {
    if (auto valid = space.validate(); !valid) {
        return valid.error();
    }

    std::unique_ptr<ITuner> tuner;
    if (config.kind == "random") {
        tuner = std::make_unique<RandomSearchTuner>(space, seed);
    } else if (config.kind == "grid") {
        if (config.grid_steps == 0 || config.grid_steps > kMaxGridSteps) {
            return Error{ErrorCode::InvalidArgument,
                         "grid_steps must be between 1 and " + std::to_string(kMaxGridSteps)};
        }
        tuner = std::make_unique<GridSearchTuner>(space, config.grid_steps);
    } else {
        return Error{ErrorCode::InvalidArgument, "Unknown tuner: " + config.kind};
    }
    return tuner;
}

}  // namespace autotune
