#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy: stable codes, infrastructure errors, and classified application errors.
 *
 * Design:
 * - Stable error codes for programmatic handling; they serialize as upper-case strings.
 * - `core::error` is the infrastructure payload used with std::expected (configuration, setup).
 * - `core::app_error` is the classified error returned by every fallible operation. Its kind
 *   labels ("validation", "network", "business") are part of the caller-visible contract.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace veritas::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  validation_failed = 2101,
  invalid_id = 2102,
  invalid_user_data = 2103,
  invalid_updates = 2104,
  invalid_updated_data = 2105,
  invalid_pagination = 2106,
  invalid_sort = 2107,
  invalid_event = 2108,
  data_corruption = 3001,
  duplicate_id = 4001,
  not_found = 6001,
  internal = 9001,
};

/** \brief Wire name of a code, e.g. "NOT_FOUND". */
auto to_string(error_code code) -> std::string_view;

/** \brief Structured infrastructure error accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "config.env" */
};

/** \brief Discriminant of a classified error. */
enum class error_kind : std::uint8_t { validation, network, business };

auto to_string(error_kind kind) -> std::string_view;

/** \brief Input did not have the required shape. */
struct validation_error {
  std::string field;
  std::string message;
  error_code code{error_code::validation_failed};
};

/** \brief A remote collaborator failed. `status` is the transport status (0 if none). */
struct network_error {
  int status{0};
  std::string message;
  std::string endpoint;
};

/** \brief A domain rule was violated (missing entity, corrupt data, internal fault). */
struct business_error {
  error_code code{error_code::internal};
  std::string message;
  std::optional<nlohmann::json> details;
};

using app_error = std::variant<validation_error, network_error, business_error>;

auto kind_of(const app_error& e) -> error_kind;

inline auto is_validation_error(const app_error& e) -> bool {
  return std::holds_alternative<validation_error>(e);
}
inline auto is_network_error(const app_error& e) -> bool {
  return std::holds_alternative<network_error>(e);
}
inline auto is_business_error(const app_error& e) -> bool {
  return std::holds_alternative<business_error>(e);
}

/** \brief Message of any error kind. */
auto message_of(const app_error& e) -> const std::string&;

/** \brief Code of a validation or business error; nullopt for network errors. */
auto code_of(const app_error& e) -> std::optional<error_code>;

} // namespace veritas::core
