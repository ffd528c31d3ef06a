#include "veritas/assertion.hpp"

#include <utility>

#include "veritas/shape.hpp"

namespace veritas::core {

namespace {

auto failed_message(std::string_view field, std::string_view expected) -> std::string {
    std::string m = "Validation failed for field '";
    m.append(field);
    m.append("': expected ");
    m.append(expected);
    return m;
}

[[noreturn]] void fail(std::string_view field, const value& v, std::string_view expected) {
    throw assertion_error(std::string(field), v, std::string(expected));
}

} // namespace

assertion_error::assertion_error(std::string field, value received, std::string expected)
    : std::runtime_error(failed_message(field, expected))
    , field_(std::move(field))
    , received_(std::move(received))
    , expected_(std::move(expected)) {}

assertion_error::assertion_error(std::string message, std::string field, value received,
                                 std::string expected)
    : std::runtime_error(std::move(message))
    , field_(std::move(field))
    , received_(std::move(received))
    , expected_(std::move(expected)) {}

void assert_that(const value& v, predicate_fn pred, std::string_view field, std::string_view expected) {
    if (pred == nullptr || !pred(v)) fail(field, v, expected);
}

void assert_defined(const value& v, std::string_view field) {
    if (v.is_null()) {
        throw assertion_error(std::string(field) + " is required but was null", std::string(field), v,
                              "defined value");
    }
}

void assert_is_string(const value& v, std::string_view field) {
    assert_that(v, &is_string, field, "string");
}

void assert_is_non_empty_string(const value& v, std::string_view field) {
    assert_that(v, &is_non_empty_string, field, "non-empty string");
}

void assert_is_number(const value& v, std::string_view field) {
    assert_that(v, &is_number, field, "number");
}

void assert_is_positive_number(const value& v, std::string_view field) {
    assert_that(v, &is_positive_number, field, "positive number");
}

void assert_is_user(const value& v, std::string_view field) {
    auto checked = validate_user(v);
    if (checked) return;
    std::string expected = "User object. Errors: ";
    bool first = true;
    for (const auto& e : checked.error()) {
        if (!first) expected += ", ";
        expected += e.field + ": " + e.message;
        first = false;
    }
    fail(field, v, expected);
}

void assert_is_array_of(const value& v, predicate_fn pred, std::string_view field) {
    if (!v.is_array()) fail(field, v, "array");
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (pred == nullptr || !pred(v[i])) {
            fail(std::string(field) + "[" + std::to_string(i) + "]", v[i], "valid array element");
        }
    }
}

void assert_has_property(const value& obj, std::string_view key, std::string_view field) {
    if (!obj.is_object() || !obj.contains(std::string(key))) {
        fail(field, obj, "object with property '" + std::string(key) + "'");
    }
}

void assert_has_typed_property(const value& obj, std::string_view key, predicate_fn pred,
                               std::string_view field) {
    assert_has_property(obj, key, field);
    const auto& prop = obj.at(std::string(key));
    if (pred == nullptr || !pred(prop)) {
        fail(std::string(field) + "." + std::string(key), prop, "valid property value");
    }
}

void assert_if(bool condition, const value& v, predicate_fn pred, std::string_view message) {
    if (condition && (pred == nullptr || !pred(v))) {
        throw assertion_error(std::string(message), "value", v, "condition to be met");
    }
}

} // namespace veritas::core
