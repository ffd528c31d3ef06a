#pragma once

/**
 * \file predicates.hpp
 * \brief Primitive and composite structural predicates over untyped values.
 *
 * Every predicate takes an arbitrary nlohmann::json value and returns a narrowing decision.
 * Predicates never throw and never mutate their input.
 *
 * Edge-case policy:
 * - NaN and +/-Infinity are not numbers.
 * - A string of only whitespace is not a non-empty string.
 * - Integers are integral values representable as int64; 30.0 qualifies, 30.5 does not.
 * - Dates are ISO-8601 strings naming a real instant (see core/timestamp.hpp).
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <nlohmann/json.hpp>

namespace veritas {

using value = nlohmann::json;

/** \brief Function-pointer form used by shape tables and array checks. */
using predicate_fn = bool (*)(const value&);

// Primitives
[[nodiscard]] auto is_string(const value& v) noexcept -> bool;
[[nodiscard]] auto is_number(const value& v) noexcept -> bool;
[[nodiscard]] auto is_boolean(const value& v) noexcept -> bool;
[[nodiscard]] auto is_null(const value& v) noexcept -> bool;
[[nodiscard]] auto is_array(const value& v) noexcept -> bool;
[[nodiscard]] auto is_object(const value& v) noexcept -> bool;

// Composites
[[nodiscard]] auto is_non_empty_string(const value& v) noexcept -> bool;
/** \brief Trimmed text is a complete finite decimal number, e.g. " -12.5e3 ". */
[[nodiscard]] auto is_numeric_string(const value& v) noexcept -> bool;
[[nodiscard]] auto is_positive_number(const value& v) noexcept -> bool;
[[nodiscard]] auto is_integer(const value& v) noexcept -> bool;
[[nodiscard]] auto is_positive_integer(const value& v) noexcept -> bool;
[[nodiscard]] auto is_non_empty_array(const value& v) noexcept -> bool;
[[nodiscard]] auto is_array_of_length(const value& v, std::size_t length) noexcept -> bool;

/** \brief A JSON object. JSON has no prototypes, so every object is plain. */
[[nodiscard]] auto is_plain_object(const value& v) noexcept -> bool;
[[nodiscard]] auto is_empty_object(const value& v) noexcept -> bool;

/** \brief Array whose every element satisfies pred. Visits every element (no short-circuit). */
[[nodiscard]] auto is_array_of(const value& v, predicate_fn pred) noexcept -> bool;

// Dates
[[nodiscard]] auto is_date(const value& v) noexcept -> bool;
[[nodiscard]] auto is_valid_date_string(const value& v) noexcept -> bool;

// String formats
[[nodiscard]] auto is_valid_email(std::string_view s) noexcept -> bool;
/** \brief `+`? then digits, spaces, dashes, parentheses; at least 10 digits. */
[[nodiscard]] auto is_valid_phone_number(std::string_view s) noexcept -> bool;

/** \brief Integer value of v; only meaningful when is_integer(v). */
[[nodiscard]] auto integer_value(const value& v) noexcept -> std::int64_t;

/** \brief Trim ASCII whitespace from both ends. */
[[nodiscard]] auto trim(std::string_view s) noexcept -> std::string_view;

} // namespace veritas
