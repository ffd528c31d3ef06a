#pragma once

/** \file config.hpp
 *  \brief Store configuration: compiled-in defaults with environment overrides.
 *
 * Environment variables (all optional):
 *   VERITAS_EVENT_CAPACITY     audit log retention, last N events kept (default 100)
 *   VERITAS_FEED_CAPACITY      session feed retention (default 50)
 *   VERITAS_DEFAULT_PAGE_SIZE  list() page size when the caller gives none (default 10)
 *   VERITAS_MAX_PAGE_SIZE      largest accepted page size (default 100)
 *   VERITAS_ID_PREFIX          prefix of generated ids (default "user_")
 *   VERITAS_LOG                enable diagnostics on stderr
 */

#include <cstddef>
#include <expected>
#include <string>

#include "veritas/error.hpp"

namespace veritas {

struct StoreConfig {
    std::size_t event_capacity{100};      /**< audit log keeps the newest N events */
    std::size_t feed_capacity{50};        /**< session feed keeps the newest N events */
    std::size_t default_page_size{10};
    std::size_t max_page_size{100};
    std::string id_prefix{"user_"};
};

/** \brief Cross-field checks: capacities and sizes non-zero, default page size <= max. */
auto validate_config(const StoreConfig& cfg) -> std::expected<void, core::error>;

/**
 * \brief Apply VERITAS_* overrides on top of base.
 * \return the merged, validated config, or config_invalid naming the offending variable.
 */
auto load_config_from_env(StoreConfig base = {}) -> std::expected<StoreConfig, core::error>;

} // namespace veritas
