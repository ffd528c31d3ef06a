#pragma once

/** \file error_mapping.hpp
 *  \brief Transport status policy for classified errors (validation -> 400, NOT_FOUND -> 404, else 500).
 */

#include "veritas/error.hpp"

namespace veritas::core {

constexpr int http_status(error_kind kind, error_code code) {
  switch (kind) {
    case error_kind::validation: return 400;
    case error_kind::business: return code == error_code::not_found ? 404 : 500;
    case error_kind::network: return 500;
  }
  return 500;
}

inline int http_status(const app_error& e) {
  return http_status(kind_of(e), code_of(e).value_or(error_code::internal));
}

} // namespace veritas::core
