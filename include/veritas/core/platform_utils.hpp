#pragma once

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace veritas::core {

// Cross-platform getenv wrapper.
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Strict unsigned decimal parse: the whole string must be digits.
inline std::optional<std::size_t> parse_size(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::size_t out = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

// "1", "true", "yes", "on" count as set; "0", "false", "off" or empty do not.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return false;
    const char c = (*v)[0];
    if (c == 'o' || c == 'O') return v->size() == 2 && ((*v)[1] == 'n' || (*v)[1] == 'N');
    return c == '1' || c == 't' || c == 'T' || c == 'y' || c == 'Y';
}

// Diagnostics to std::cerr are emitted only when VERITAS_LOG is set. Read once per process.
inline bool log_enabled() noexcept {
    static const bool enabled = env_flag("VERITAS_LOG");
    return enabled;
}

} // namespace veritas::core
