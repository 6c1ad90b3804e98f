/**
 * @file types.cpp
 * @brief String rendering for trial parameter values.
 */

#include "core/types.hpp"
#include "core/json.hpp"

#include <sstream>
#include <type_traits>

namespace autotune {

std::string to_string(const ParameterValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else {
            return std::to_string(v);
        }
    }, value);
}

std::string to_json(const Parameters& parameters) {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [name, value] : parameters) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << escape_json(name) << "\":";
        if (std::holds_alternative<std::string>(value)) {
            oss << '"' << escape_json(std::get<std::string>(value)) << '"';
        } else if (const auto* d = std::get_if<double>(&value)) {
            write_json_number(oss, *d);
        } else {
            oss << to_string(value);
        }
    }
    oss << '}';
    return oss.str();
}

}  // namespace autotune
