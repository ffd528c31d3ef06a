#pragma once

/** \file form.hpp
 *  \brief Validation of string-typed form submissions into create input.
 *
 * A form carries `name`, `email`, `age` and `tags` as strings and `isActive` as a boolean.
 * Values are normalized on success: name trimmed, age parsed as a decimal integer in
 * [1, 120], tags split on ',' with blanks dropped. The produced object is suitable input for
 * UserStore::create.
 */

#include "veritas/predicates.hpp"
#include "veritas/shape.hpp"

namespace veritas {

/** \brief All five form keys present with the right primitive types. */
[[nodiscard]] auto is_user_form_data(const value& v) noexcept -> bool;

/**
 * \brief Validate a form submission.
 * \return create input `{name, contact: {email}, age, isActive, tags}` or every failing field.
 * A structurally wrong form yields the single error {field: "name", message: "Invalid form data structure"}.
 */
[[nodiscard]] auto validate_user_form(const value& v) -> validation_result<value>;

} // namespace veritas
