/**
 * @file tuner.hpp
 * @brief Tuner interface — proposes the next trial configuration.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "tuner/search_space.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace autotune {

/**
 * @brief Abstract search strategy.
 *
 * Each proposal must carry a trial id strictly greater than the previous
 * one. Returning std::nullopt tells the scheduler the search is exhausted.
 */
class ITuner {
public:
    virtual ~ITuner() = default;

    virtual std::optional<TrialSettings> propose(std::span<const TrialResult> history) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Upper bound on grid points per parameter.
inline constexpr uint32_t kMaxGridSteps = 1000;

struct TunerConfig {
    std::string kind = "random";        ///< "random", "grid"
    uint32_t grid_steps = 5;
};

/**
 * @brief Build a tuner by name over a validated search space.
 */
Result<std::unique_ptr<ITuner>> create_tuner(const TunerConfig& config,
                                             const SearchSpace& space,
                                             uint64_t seed);

}  // namespace autotune
