#include "veritas/error.hpp"

#include <stdexcept>

#include "veritas/core/overloaded.hpp"

namespace veritas::core {

auto to_string(error_code code) -> std::string_view {
  switch (code) {
    case error_code::ok: return "OK";
    case error_code::config_invalid: return "CONFIG_INVALID";
    case error_code::validation_failed: return "VALIDATION_ERROR";
    case error_code::invalid_id: return "INVALID_ID";
    case error_code::invalid_user_data: return "INVALID_USER_DATA";
    case error_code::invalid_updates: return "INVALID_UPDATES";
    case error_code::invalid_updated_data: return "INVALID_UPDATED_DATA";
    case error_code::invalid_pagination: return "INVALID_PAGINATION";
    case error_code::invalid_sort: return "INVALID_SORT";
    case error_code::invalid_event: return "INVALID_EVENT";
    case error_code::data_corruption: return "DATA_CORRUPTION";
    case error_code::duplicate_id: return "DUPLICATE_ID";
    case error_code::not_found: return "NOT_FOUND";
    case error_code::internal: return "INTERNAL_ERROR";
  }
  throw std::logic_error("unhandled error_code " + std::to_string(static_cast<std::uint32_t>(code)));
}

auto to_string(error_kind kind) -> std::string_view {
  switch (kind) {
    case error_kind::validation: return "validation";
    case error_kind::network: return "network";
    case error_kind::business: return "business";
  }
  throw std::logic_error("unhandled error_kind");
}

auto kind_of(const app_error& e) -> error_kind {
  return std::visit(overloaded{
      [](const validation_error&) { return error_kind::validation; },
      [](const network_error&) { return error_kind::network; },
      [](const business_error&) { return error_kind::business; },
  }, e);
}

auto message_of(const app_error& e) -> const std::string& {
  return std::visit([](const auto& x) -> const std::string& { return x.message; }, e);
}

auto code_of(const app_error& e) -> std::optional<error_code> {
  return std::visit(overloaded{
      [](const validation_error& v) -> std::optional<error_code> { return v.code; },
      [](const network_error&) -> std::optional<error_code> { return std::nullopt; },
      [](const business_error& b) -> std::optional<error_code> { return b.code; },
  }, e);
}

} // namespace veritas::core
