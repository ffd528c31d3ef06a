#pragma once

/** \file envelope.hpp
 *  \brief Response envelope and the top-level exception guard.
 *
 * Envelope wire form:
 *   success: {"success": true, "data": ..., "metadata"?: {...}, "pagination"?: {...}}
 *   failure: {"success": false, "error": {"type": ..., ...}, "context"?: {...}}
 */

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "veritas/assertion.hpp"
#include "veritas/result.hpp"
#include "veritas/store/user_store.hpp"

namespace veritas::api {

/** \brief {"type": kind, ...fields of that kind}. */
[[nodiscard]] auto error_to_json(const core::app_error& e) -> value;

/** \brief Parse a raw request body; malformed JSON is a validation failure on field "body". */
[[nodiscard]] auto parse_body(std::string_view text) -> result<value>;

[[nodiscard]] auto failure_envelope(const failure_value& f) -> value;

template <typename T>
[[nodiscard]] auto to_envelope(const result<T>& r) -> value {
    if (!r) return failure_envelope(r.error());
    value out = value::object();
    out["success"] = true;
    if constexpr (std::is_same_v<T, UserPage>) {
        value page = to_json(r->data);
        out["data"] = std::move(page["users"]);
        out["pagination"] = std::move(page["pagination"]);
    } else if constexpr (std::is_same_v<T, value>) {
        out["data"] = r->data;
    } else {
        out["data"] = to_json(r->data);
    }
    if (r->metadata) out["metadata"] = *r->metadata;
    return out;
}

/** \brief Log and classify an escaped exception as business/INTERNAL_ERROR. */
[[nodiscard]] auto internal_failure(std::string_view op, const std::exception& ex)
    -> std::unexpected<failure_value>;

/**
 * \brief Run fn, converting any exception that escapes into business/INTERNAL_ERROR.
 *
 * fn must return a result<T>. Assertion failures keep their field and expectation in the
 * failure context.
 */
template <typename F>
auto guard(std::string_view op, F&& fn) -> std::invoke_result_t<F> {
    try {
        return std::forward<F>(fn)();
    } catch (const core::assertion_error& ex) {
        auto f = internal_failure(op, ex);
        f.error().context = value{{"field", ex.field()}, {"expected", ex.expected()}};
        return f;
    } catch (const std::exception& ex) {
        return internal_failure(op, ex);
    }
}

} // namespace veritas::api
