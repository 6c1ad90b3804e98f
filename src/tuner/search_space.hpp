/**
 * @file search_space.hpp
 * @brief Named hyperparameter ranges explored by the tuners.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace autotune {

enum class ParameterKind : uint8_t {
    Uniform,    ///< Continuous range [min, max]
    Integer,    ///< Inclusive integer range [min, max]
    Choice      ///< One of a list of strings
};

[[nodiscard]] constexpr std::string_view to_string(ParameterKind kind) noexcept {
    switch (kind) {
        case ParameterKind::Uniform: return "uniform";
        case ParameterKind::Integer: return "integer";
        case ParameterKind::Choice:  return "choice";
    }
    return "unknown";
}

Result<ParameterKind> parse_parameter_kind(std::string_view text);

struct ParameterSpec {
    std::string name;
    ParameterKind kind = ParameterKind::Uniform;
    double min = 0.0;
    double max = 1.0;
    std::vector<std::string> choices;
};

/**
 * @brief An ordered collection of parameter specifications.
 *
 * Parameter order is insertion order; grid enumeration varies the last
 * parameter fastest.
 */
class SearchSpace {
public:
    SearchSpace() = default;
    explicit SearchSpace(std::vector<ParameterSpec> specs);

    SearchSpace& add_uniform(std::string name, double min, double max);
    SearchSpace& add_integer(std::string name, int64_t min, int64_t max);
    SearchSpace& add_choice(std::string name, std::vector<std::string> choices);

    /// Checks names are non-empty and unique, ranges ordered, choices non-empty.
    [[nodiscard]] Result<void> validate() const;

    /// Draw one value per parameter. The space must have passed validate().
    [[nodiscard]] Parameters sample(std::mt19937_64& rng) const;

    /**
     * @brief Discrete values of one parameter for grid enumeration.
     *
     * Uniform ranges yield @p steps evenly spaced points (both ends included),
     * integer ranges yield at most @p steps distinct integers, choices yield
     * every choice. @p spec must have passed validate().
     */
    [[nodiscard]] std::vector<ParameterValue> grid_values(const ParameterSpec& spec,
                                                          size_t steps) const;

    [[nodiscard]] const std::vector<ParameterSpec>& parameters() const noexcept { return specs_; }
    [[nodiscard]] size_t size() const noexcept { return specs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return specs_.empty(); }

private:
    std::vector<ParameterSpec> specs_;
};

}  // namespace autotune
