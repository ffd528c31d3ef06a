#pragma once

/**
 * \file assertion.hpp
 * \brief Fail-fast checks for trust boundaries.
 *
 * An assertion either returns normally with no side effect, or throws assertion_error carrying
 * the field name, the received value and a description of what was expected. Assertions mark
 * programmer-trust violations (a caller claiming data is already valid when it is not); they
 * are caught once by api::guard and never used for routine input validation.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "veritas/predicates.hpp"

namespace veritas::core {

class assertion_error : public std::runtime_error {
public:
    assertion_error(std::string field, value received, std::string expected);
    assertion_error(std::string message, std::string field, value received, std::string expected);

    [[nodiscard]] auto field() const noexcept -> const std::string& { return field_; }
    [[nodiscard]] auto received() const noexcept -> const value& { return received_; }
    [[nodiscard]] auto expected() const noexcept -> const std::string& { return expected_; }

private:
    std::string field_;
    value received_;
    std::string expected_;
};

/** \brief Throw unless pred(v). */
void assert_that(const value& v, predicate_fn pred, std::string_view field, std::string_view expected);

/** \brief Throw if v is null. JSON has no undefined; an absent key should be passed as null. */
void assert_defined(const value& v, std::string_view field = "value");
void assert_is_string(const value& v, std::string_view field = "value");
void assert_is_non_empty_string(const value& v, std::string_view field = "value");
void assert_is_number(const value& v, std::string_view field = "value");
void assert_is_positive_number(const value& v, std::string_view field = "value");

/** \brief Throw unless v passes detailed user validation; the message lists every failing field. */
void assert_is_user(const value& v, std::string_view field = "value");

/** \brief Throw unless v is an array whose elements all satisfy pred; reports `field[index]`. */
void assert_is_array_of(const value& v, predicate_fn pred, std::string_view field = "value");

/** \brief Throw unless the object has key. */
void assert_has_property(const value& obj, std::string_view key, std::string_view field = "object");

/** \brief Throw unless the object has key and pred(obj[key]); reports `field.key`. */
void assert_has_typed_property(const value& obj, std::string_view key, predicate_fn pred,
                               std::string_view field = "object");

/** \brief When condition holds, throw unless pred(v). */
void assert_if(bool condition, const value& v, predicate_fn pred, std::string_view message);

} // namespace veritas::core
