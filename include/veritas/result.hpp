#pragma once

/**
 * \file result.hpp
 * \brief Two-case operation outcome: success with payload, or failure with a classified error.
 *
 * result<T> is a std::expected, so a value can never carry both a payload and an error,
 * nor neither. Consumers use is_success / is_failure instead of has_value() so the boundary
 * stays stable if the representation changes.
 */

#include <expected>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

#include "veritas/error.hpp"

namespace veritas {

template <typename T>
struct success_value {
  T data;
  std::optional<nlohmann::json> metadata;
};

struct failure_value {
  core::app_error error;
  std::optional<nlohmann::json> context;
};

template <typename T>
using result = std::expected<success_value<T>, failure_value>;

template <typename T>
[[nodiscard]] auto success(T data, std::optional<nlohmann::json> metadata = std::nullopt)
    -> result<T> {
  return success_value<T>{std::move(data), std::move(metadata)};
}

/** \brief Failure for any result<T>; converts implicitly through std::unexpected. */
[[nodiscard]] inline auto failure(core::app_error error,
                                  std::optional<nlohmann::json> context = std::nullopt)
    -> std::unexpected<failure_value> {
  return std::unexpected(failure_value{std::move(error), std::move(context)});
}

template <typename T>
[[nodiscard]] constexpr auto is_success(const result<T>& r) noexcept -> bool {
  return r.has_value();
}

template <typename T>
[[nodiscard]] constexpr auto is_failure(const result<T>& r) noexcept -> bool {
  return !r.has_value();
}

/** \brief Re-wrap a failure of one payload type as a failure of another. */
template <typename T>
[[nodiscard]] auto forward_failure(const result<T>& r) -> std::unexpected<failure_value> {
  return std::unexpected(r.error());
}

} // namespace veritas
