/**
 * @file json.hpp
 * @brief Helpers for rendering hand-built NDJSON lines.
 */

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace autotune {

/**
 * @brief Escape a string for embedding inside a JSON string literal.
 */
[[nodiscard]] std::string escape_json(std::string_view text);

/**
 * @brief Write a number as a JSON value; NaN and infinities become null.
 */
void write_json_number(std::ostream& out, double value);

}  // namespace autotune
