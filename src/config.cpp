#include "veritas/config.hpp"

#include "veritas/core/platform_utils.hpp"

namespace veritas {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::config_invalid, std::move(message), "config"});
}

auto read_size(const char* name, std::size_t& out) -> std::expected<void, core::error> {
    auto raw = core::safe_getenv(name);
    if (!raw) return {};
    auto parsed = core::parse_size(*raw);
    if (!parsed) return invalid(std::string(name) + " must be an unsigned integer, got '" + *raw + "'");
    out = *parsed;
    return {};
}

} // namespace

auto validate_config(const StoreConfig& cfg) -> std::expected<void, core::error> {
    if (cfg.event_capacity == 0) return invalid("event_capacity must be > 0");
    if (cfg.feed_capacity == 0) return invalid("feed_capacity must be > 0");
    if (cfg.max_page_size == 0) return invalid("max_page_size must be > 0");
    if (cfg.default_page_size == 0 || cfg.default_page_size > cfg.max_page_size) {
        return invalid("default_page_size must be in [1, max_page_size]");
    }
    if (cfg.id_prefix.empty()) return invalid("id_prefix must not be empty");
    return {};
}

auto load_config_from_env(StoreConfig base) -> std::expected<StoreConfig, core::error> {
    if (auto r = read_size("VERITAS_EVENT_CAPACITY", base.event_capacity); !r) return std::unexpected(r.error());
    if (auto r = read_size("VERITAS_FEED_CAPACITY", base.feed_capacity); !r) return std::unexpected(r.error());
    if (auto r = read_size("VERITAS_DEFAULT_PAGE_SIZE", base.default_page_size); !r) return std::unexpected(r.error());
    if (auto r = read_size("VERITAS_MAX_PAGE_SIZE", base.max_page_size); !r) return std::unexpected(r.error());
    if (auto prefix = core::safe_getenv("VERITAS_ID_PREFIX")) base.id_prefix = *prefix;
    if (auto v = validate_config(base); !v) return std::unexpected(v.error());
    return base;
}

} // namespace veritas
