#include "veritas/audit_event.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "veritas/core/overloaded.hpp"

namespace veritas {

namespace {

auto is_creation_source(const value& v) noexcept -> bool {
    return is_string(v) && creation_source_from_string(v.get_ref<const std::string&>()).has_value();
}

auto is_optional_text(const value& v) noexcept -> bool { return is_string(v); }

auto user_errors(const value& v) -> std::vector<field_error> { return shape_errors(user_shape(), v); }

constexpr field_rule kEnvelopeShape[] = {
    {"type", true, &is_string, "type must be a string", nullptr},
    {"timestamp", true, &is_date, "timestamp must be a valid date", nullptr},
    {"data", true, &is_object, "data must be an object", nullptr},
};

constexpr field_rule kCreatedShape[] = {
    {"user", true, &is_user, "user must be a valid user", &user_errors},
    {"source", true, &is_creation_source, "source must be one of registration, admin, import", nullptr},
    {"metadata", false, &is_plain_object, "metadata must be a plain object", nullptr},
};

constexpr field_rule kUpdatedShape[] = {
    {"userId", true, &is_non_empty_string, "userId must be a non-empty string", nullptr},
    {"changes", true, &is_object, "changes must be an object", nullptr},
    {"previousValues", true, &is_object, "previousValues must be an object", nullptr},
    {"updatedBy", true, &is_non_empty_string, "updatedBy must be a non-empty string", nullptr},
};

constexpr field_rule kDeletedShape[] = {
    {"userId", true, &is_non_empty_string, "userId must be a non-empty string", nullptr},
    {"deletedBy", true, &is_non_empty_string, "deletedBy must be a non-empty string", nullptr},
    {"reason", false, &is_optional_text, "reason must be a string", nullptr},
    {"backup", true, &is_user, "backup must be a valid user", &user_errors},
};

constexpr field_rule kLoginAttemptShape[] = {
    {"userId", true, &is_non_empty_string, "userId must be a non-empty string", nullptr},
    {"ip", true, &is_non_empty_string, "ip must be a non-empty string", nullptr},
    {"userAgent", true, &is_non_empty_string, "userAgent must be a non-empty string", nullptr},
    {"successful", true, &is_boolean, "successful must be a boolean", nullptr},
    {"failureReason", false, &is_optional_text, "failureReason must be a string", nullptr},
};

auto payload_shape(EventKind kind) -> std::span<const field_rule> {
    switch (kind) {
        case EventKind::created: return kCreatedShape;
        case EventKind::updated: return kUpdatedShape;
        case EventKind::deleted: return kDeletedShape;
        case EventKind::login_attempt: return kLoginAttemptShape;
    }
    throw std::logic_error("unhandled event kind");
}

auto text(const value& v, const char* key) -> std::string { return v.at(key).get<std::string>(); }

auto optional_text(const value& v, const char* key) -> std::optional<std::string> {
    if (!v.contains(key)) return std::nullopt;
    return v.at(key).get<std::string>();
}

// Shape-accepted user values always narrow.
auto narrow_user(const value& v) -> User { return *validate_user(v); }

auto narrow_payload(EventKind kind, const value& d) -> EventPayload {
    switch (kind) {
        case EventKind::created: {
            UserCreated p;
            p.user = narrow_user(d.at("user"));
            p.source = *creation_source_from_string(d.at("source").get_ref<const std::string&>());
            if (d.contains("metadata")) p.metadata = d.at("metadata");
            return p;
        }
        case EventKind::updated:
            return UserUpdated{text(d, "userId"), d.at("changes"), d.at("previousValues"),
                               text(d, "updatedBy")};
        case EventKind::deleted:
            return UserDeleted{text(d, "userId"), text(d, "deletedBy"), optional_text(d, "reason"),
                               narrow_user(d.at("backup"))};
        case EventKind::login_attempt:
            return LoginAttempt{text(d, "userId"), text(d, "ip"), text(d, "userAgent"),
                                d.at("successful").get<bool>(), optional_text(d, "failureReason")};
    }
    throw std::logic_error("unhandled event kind");
}

} // namespace

auto kind_of(const AuditEvent& e) noexcept -> EventKind {
    return std::visit(core::overloaded{
        [](const UserCreated&) { return EventKind::created; },
        [](const UserUpdated&) { return EventKind::updated; },
        [](const UserDeleted&) { return EventKind::deleted; },
        [](const LoginAttempt&) { return EventKind::login_attempt; },
    }, e.payload);
}

auto to_string(EventKind kind) -> std::string_view {
    switch (kind) {
        case EventKind::created: return "created";
        case EventKind::updated: return "updated";
        case EventKind::deleted: return "deleted";
        case EventKind::login_attempt: return "login-attempt";
    }
    throw std::logic_error("unhandled event kind");
}

auto event_kind_from_string(std::string_view s) noexcept -> std::optional<EventKind> {
    if (s == "created") return EventKind::created;
    if (s == "updated") return EventKind::updated;
    if (s == "deleted") return EventKind::deleted;
    if (s == "login-attempt") return EventKind::login_attempt;
    return std::nullopt;
}

auto to_string(CreationSource source) -> std::string_view {
    switch (source) {
        case CreationSource::registration: return "registration";
        case CreationSource::admin: return "admin";
        case CreationSource::imported: return "import";
    }
    throw std::logic_error("unhandled creation source");
}

auto creation_source_from_string(std::string_view s) noexcept -> std::optional<CreationSource> {
    if (s == "registration") return CreationSource::registration;
    if (s == "admin") return CreationSource::admin;
    if (s == "import") return CreationSource::imported;
    return std::nullopt;
}

auto is_audit_event(const value& v) noexcept -> bool {
    if (!matches_shape(kEnvelopeShape, v)) return false;
    auto kind = event_kind_from_string(v.at("type").get_ref<const std::string&>());
    if (!kind) return false;
    return matches_shape(payload_shape(*kind), v.at("data"));
}

auto validate_event_payload(EventKind kind, const value& data) -> validation_result<EventPayload> {
    auto errors = shape_errors(payload_shape(kind), data);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_payload(kind, data);
}

auto validate_audit_event(const value& v) -> validation_result<AuditEvent> {
    auto errors = shape_errors(kEnvelopeShape, v);
    if (!v.is_object()) return std::unexpected(std::move(errors));

    std::optional<EventKind> kind;
    if (auto it = v.find("type"); it != v.end() && it->is_string()) {
        kind = event_kind_from_string(it->get_ref<const std::string&>());
        if (!kind) errors.push_back(field_error{"type", "Unknown event type", *it});
    }

    std::optional<EventPayload> payload;
    if (auto it = v.find("data"); kind && it != v.end() && it->is_object()) {
        auto p = validate_event_payload(*kind, *it);
        if (p) {
            payload = std::move(*p);
        } else {
            value detail = value::object();
            detail["received"] = *it;
            detail["errors"] = to_json(p.error());
            errors.push_back(field_error{"data", "data must be a valid " + std::string(to_string(*kind)) + " payload",
                                         std::move(detail)});
        }
    }

    if (!errors.empty()) return std::unexpected(std::move(errors));
    const auto ts = *core::parse_timestamp(v.at("timestamp").get_ref<const std::string&>());
    return AuditEvent{ts, std::move(*payload)};
}

auto payload_to_json(const EventPayload& p) -> value {
    return std::visit(core::overloaded{
        [](const UserCreated& c) {
            value d = value::object();
            d["user"] = to_json(c.user);
            d["source"] = std::string(to_string(c.source));
            if (c.metadata) d["metadata"] = *c.metadata;
            return d;
        },
        [](const UserUpdated& u) {
            value d = value::object();
            d["userId"] = u.user_id;
            d["changes"] = u.changes;
            d["previousValues"] = u.previous_values;
            d["updatedBy"] = u.updated_by;
            return d;
        },
        [](const UserDeleted& x) {
            value d = value::object();
            d["userId"] = x.user_id;
            d["deletedBy"] = x.deleted_by;
            if (x.reason) d["reason"] = *x.reason;
            d["backup"] = to_json(x.backup);
            return d;
        },
        [](const LoginAttempt& l) {
            value d = value::object();
            d["userId"] = l.user_id;
            d["ip"] = l.ip;
            d["userAgent"] = l.user_agent;
            d["successful"] = l.successful;
            if (l.failure_reason) d["failureReason"] = *l.failure_reason;
            return d;
        },
    }, p);
}

auto to_json(const AuditEvent& e) -> value {
    value j = value::object();
    j["type"] = std::string(to_string(kind_of(e)));
    j["timestamp"] = core::format_timestamp(e.timestamp);
    j["data"] = payload_to_json(e.payload);
    return j;
}

} // namespace veritas
