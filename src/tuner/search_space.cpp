/**
 * @file search_space.cpp
 * @brief SearchSpace validation, sampling and grid discretisation.
 */

#include "tuner/search_space.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace autotune {

namespace {

// Doubles bounding the values representable as int64_t: [-2^63, 2^63).
constexpr double kInt64Lowest = -9223372036854775808.0;
constexpr double kInt64UpperBound = 9223372036854775808.0;

}  // anonymous namespace

Result<ParameterKind> parse_parameter_kind(std::string_view text) {
    if (text == "uniform") return ParameterKind::Uniform;
    if (text == "integer") return ParameterKind::Integer;
    if (text == "choice")  return ParameterKind::Choice;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown parameter type: " + std::string{text}};
}

SearchSpace::SearchSpace(std::vector<ParameterSpec> specs)
    : specs_(std::move(specs)) {}

SearchSpace& SearchSpace::add_uniform(std::string name, double min, double max) {
    specs_.push_back(ParameterSpec{
        .name = std::move(name),
        .kind = ParameterKind::Uniform,
        .min = min,
        .max = max,
        .choices = {}
    });
    return *this;
}

SearchSpace& SearchSpace::add_integer(std::string name, int64_t min, int64_t max) {
    specs_.push_back(ParameterSpec{
        .name = std::move(name),
        .kind = ParameterKind::Integer,
        .min = static_cast<double>(min),
        .max = static_cast<double>(max),
        .choices = {}
    });
    return *this;
}

SearchSpace& SearchSpace::add_choice(std::string name, std::vector<std::string> choices) {
    specs_.push_back(ParameterSpec{
        .name = std::move(name),
        .kind = ParameterKind::Choice,
        .min = 0.0,
        .max = 0.0,
        .choices = std::move(choices)
    });
    return *this;
}

Result<void> SearchSpace::validate() const {
    std::unordered_set<std::string> seen;
    for (const auto& spec : specs_) {
        if (spec.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "Parameter with empty name"};
        }
        if (!seen.insert(spec.name).second) {
            return Error{ErrorCode::InvalidArgument, "Duplicate parameter: " + spec.name};
        }
        switch (spec.kind) {
            case ParameterKind::Uniform:
            case ParameterKind::Integer:
                if (!std::isfinite(spec.min) || !std::isfinite(spec.max) || spec.min > spec.max) {
                    return Error{ErrorCode::InvalidArgument,
                                 "Invalid range for parameter: " + spec.name};
                }
                if (spec.kind == ParameterKind::Integer) {
                    if (std::ceil(spec.min) < kInt64Lowest
                        || std::floor(spec.max) >= kInt64UpperBound) {
                        return Error{ErrorCode::InvalidArgument,
                                     "Integer range exceeds 64 bits for parameter: " + spec.name};
                    }
                    if (std::ceil(spec.min) > std::floor(spec.max)) {
                        return Error{ErrorCode::InvalidArgument,
                                     "Empty integer range for parameter: " + spec.name};
                    }
                }
                break;
            case ParameterKind::Choice:
                if (spec.choices.empty()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "No choices for parameter: " + spec.name};
                }
                break;
        }
    }
    return {};
}

Parameters SearchSpace::sample(std::mt19937_64& rng) const {
    Parameters params;
    for (const auto& spec : specs_) {
        switch (spec.kind) {
            case ParameterKind::Uniform: {
                std::uniform_real_distribution<double> dist(spec.min, spec.max);
                params[spec.name] = spec.min == spec.max ? spec.min : dist(rng);
                break;
            }
            case ParameterKind::Integer: {
                std::uniform_int_distribution<int64_t> dist(
                    static_cast<int64_t>(std::ceil(spec.min)),
                    static_cast<int64_t>(std::floor(spec.max)));
                params[spec.name] = dist(rng);
                break;
            }
            case ParameterKind::Choice: {
                std::uniform_int_distribution<size_t> dist(0, spec.choices.size() - 1);
                params[spec.name] = spec.choices[dist(rng)];
                break;
            }
        }
    }
    return params;
}

std::vector<ParameterValue> SearchSpace::grid_values(const ParameterSpec& spec,
                                                     size_t steps) const {
    std::vector<ParameterValue> values;
    steps = std::max<size_t>(steps, 1);

    switch (spec.kind) {
        case ParameterKind::Uniform: {
            if (steps == 1 || spec.min == spec.max) {
                values.emplace_back(spec.min);
                break;
            }
            double step = (spec.max - spec.min) / static_cast<double>(steps - 1);
            for (size_t i = 0; i < steps; ++i) {
                values.emplace_back(i + 1 == steps ? spec.max
                                                   : spec.min + step * static_cast<double>(i));
            }
            break;
        }
        case ParameterKind::Integer: {
            auto lo = static_cast<int64_t>(std::ceil(spec.min));
            auto hi = static_cast<int64_t>(std::floor(spec.max));
            // hi - lo in unsigned arithmetic; the full int64 range does not fit signed.
            uint64_t span = static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo);
            if (span < steps) {
                for (int64_t v = lo;; ++v) {
                    values.emplace_back(v);
                    if (v == hi) break;
                }
                break;
            }
            if (steps == 1) {
                values.emplace_back(lo);
                break;
            }
            double stride = static_cast<double>(span) / static_cast<double>(steps - 1);
            int64_t last = hi;
            for (size_t i = 0; i < steps; ++i) {
                int64_t v = hi;
                if (i + 1 < steps) {
                    double offset = std::round(stride * static_cast<double>(i));
                    uint64_t step_offset = offset >= static_cast<double>(span)
                        ? span : static_cast<uint64_t>(offset);
                    v = static_cast<int64_t>(static_cast<uint64_t>(lo) + step_offset);
                }
                if (i == 0 || v != last) values.emplace_back(v);
                last = v;
            }
            break;
        }
        case ParameterKind::Choice:
            for (const auto& choice : spec.choices) values.emplace_back(choice);
            break;
    }
    return values;
}

}  // namespace autotune
