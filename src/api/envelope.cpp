#include "veritas/api/envelope.hpp"

#include <iostream>

#include "veritas/core/overloaded.hpp"
#include "veritas/core/platform_utils.hpp"

namespace veritas::api {

auto error_to_json(const core::app_error& e) -> value {
    value out = std::visit(core::overloaded{
        [](const core::validation_error& v) {
            return value{{"field", v.field}, {"message", v.message},
                         {"code", std::string(core::to_string(v.code))}};
        },
        [](const core::network_error& n) {
            return value{{"status", n.status}, {"message", n.message}, {"endpoint", n.endpoint}};
        },
        [](const core::business_error& b) {
            value j{{"code", std::string(core::to_string(b.code))}, {"message", b.message}};
            if (b.details) j["details"] = *b.details;
            return j;
        },
    }, e);
    out["type"] = std::string(core::to_string(core::kind_of(e)));
    return out;
}

auto parse_body(std::string_view text) -> result<value> {
    value parsed = value::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return failure(core::validation_error{"body", "Invalid JSON in request body",
                                              core::error_code::validation_failed});
    }
    return success(std::move(parsed));
}

auto failure_envelope(const failure_value& f) -> value {
    value out = value::object();
    out["success"] = false;
    out["error"] = error_to_json(f.error);
    if (f.context) out["context"] = *f.context;
    return out;
}

auto internal_failure(std::string_view op, const std::exception& ex) -> std::unexpected<failure_value> {
    if (core::log_enabled()) std::cerr << "[API][" << op << "] unexpected exception: " << ex.what() << std::endl;
    return failure(core::business_error{core::error_code::internal, "An unexpected error occurred", std::nullopt});
}

} // namespace veritas::api
